#include <catch2/catch_test_macros.hpp>

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"
#include "videoml/pipeline/render_handoff.h"
#include "test_helpers.h"

using namespace videoml;

static const bool _init = [] {
    spdlog::set_level(spdlog::level::warn);
    return true;
}();

namespace {

struct RenderFixture {
    test::TempDir       tmp;
    test::FakeRenderer  renderer;
    test::FakeEncoder   encoder;
    RenderInputs        inputs;
    RenderOptions       options;

    RenderFixture() {
        test::write_file(tmp.path / "intro.script.json", R"({"scenes": [{"id": "s1"}]})");
        test::write_file(tmp.path / "intro.timeline.json", R"({"duration_frames": 90})");
        test::write_file(tmp.path / "intro.wav", "RIFF");

        inputs.script   = "intro.script.json";
        inputs.timeline = fs::path("intro.timeline.json");
        inputs.audio    = fs::path("intro.wav");

        options.frames_dir  = "frames";
        options.output_path = "out/intro.mp4";
    }

    RenderHandoff handoff() { return RenderHandoff(renderer, encoder); }
};

}  // namespace

// ─── build_request ────────────────────────────────────────────────

TEST_CASE("build_request — resolves every path against cwd", "[render]") {
    RenderFixture f;
    auto request = f.handoff().build_request(f.inputs, f.options, f.tmp.path);

    REQUIRE(request.frames_dir == f.tmp.path / "frames");
    REQUIRE(request.output_path == f.tmp.path / "out" / "intro.mp4");
    REQUIRE(request.audio_path == f.tmp.path / "intro.wav");
    REQUIRE(request.script["scenes"][0]["id"] == "s1");
    REQUIRE(request.timeline.has_value());
    REQUIRE((*request.timeline)["duration_frames"] == 90);
}

TEST_CASE("build_request — knobs are forwarded", "[render]") {
    RenderFixture f;
    f.options.title           = "Welcome";
    f.options.start_frame     = 10;
    f.options.end_frame       = 40;
    f.options.workers         = 4;
    f.options.scale           = 2.0;
    f.options.fps             = 24.0;
    f.options.width           = 1920;
    f.options.height          = 1080;
    f.options.duration_frames = 300;
    f.options.debug_layout    = true;
    f.options.browser_bundle  = fs::path("bundle.js");
    f.options.ffmpeg_args     = {"-crf", "20"};

    auto request = f.handoff().build_request(f.inputs, f.options, f.tmp.path);
    REQUIRE(request.title == "Welcome");
    REQUIRE(request.start_frame == 10);
    REQUIRE(request.end_frame == 40u);
    REQUIRE(request.workers == 4u);
    REQUIRE(request.device_scale_factor == 2.0);
    REQUIRE(request.fps == 24.0);
    REQUIRE(request.width == 1920u);
    REQUIRE(request.duration_frames == 300u);
    REQUIRE(request.debug_layout);
    REQUIRE(request.browser_bundle == f.tmp.path / "bundle.js");
    REQUIRE(request.encoder_args == std::vector<std::string>{"-crf", "20"});
}

TEST_CASE("build_request — timeline and audio are optional", "[render]") {
    RenderFixture f;
    f.inputs.timeline.reset();
    f.inputs.audio.reset();

    auto request = f.handoff().build_request(f.inputs, f.options, f.tmp.path);
    REQUIRE_FALSE(request.timeline.has_value());
    REQUIRE_FALSE(request.audio_path.has_value());
}

TEST_CASE("build_request — missing script is a MissingArtifactError", "[render]") {
    RenderFixture f;
    f.inputs.script = "missing.script.json";

    try {
        (void)f.handoff().build_request(f.inputs, f.options, f.tmp.path);
        FAIL("expected MissingArtifactError");
    } catch (const MissingArtifactError& e) {
        REQUIRE(e.path() == f.tmp.path / "missing.script.json");
    }
}

TEST_CASE("build_request — missing timeline or audio", "[render]") {
    RenderFixture f;

    SECTION("timeline") {
        f.inputs.timeline = fs::path("nope.timeline.json");
        REQUIRE_THROWS_AS(f.handoff().build_request(f.inputs, f.options, f.tmp.path), NotFoundError);
    }
    SECTION("audio") {
        f.inputs.audio = fs::path("nope.wav");
        REQUIRE_THROWS_AS(f.handoff().build_request(f.inputs, f.options, f.tmp.path), NotFoundError);
    }
}

TEST_CASE("build_request — invalid script JSON", "[render]") {
    RenderFixture f;
    test::write_file(f.tmp.path / "intro.script.json", "{ not json");
    REQUIRE_THROWS_AS(f.handoff().build_request(f.inputs, f.options, f.tmp.path), ValidationError);
}

TEST_CASE("build_request — numeric validation", "[render]") {
    RenderFixture f;

    SECTION("negative start") { f.options.start_frame = -1; }
    SECTION("end before start") { f.options.start_frame = 10; f.options.end_frame = 5; }
    SECTION("zero workers") { f.options.workers = 0; }
    SECTION("zero width") { f.options.width = 0; }
    SECTION("non-positive scale") { f.options.scale = 0.0; }
    SECTION("non-positive fps") { f.options.fps = -30.0; }
    SECTION("empty pattern") { f.options.frame_pattern.clear(); }

    REQUIRE_THROWS_AS(f.handoff().build_request(f.inputs, f.options, f.tmp.path), ValidationError);
}

TEST_CASE("build_request — bad numbers are reported before missing files", "[render]") {
    RenderFixture f;
    f.inputs.script = "missing.script.json";
    f.options.workers = 0;

    try {
        (void)f.handoff().build_request(f.inputs, f.options, f.tmp.path);
        FAIL("expected ValidationError");
    } catch (const MissingArtifactError&) {
        FAIL("file checked before numbers");
    } catch (const ValidationError& e) {
        REQUIRE(std::string(e.what()).find("--workers") != std::string::npos);
    }
}

TEST_CASE("build_request — output inside a cleaned frames directory", "[render]") {
    RenderFixture f;
    f.options.output_path = "frames/video.mp4";
    REQUIRE_THROWS_AS(f.handoff().build_request(f.inputs, f.options, f.tmp.path), ValidationError);

    f.options.clean_frames = false;
    REQUIRE_NOTHROW(f.handoff().build_request(f.inputs, f.options, f.tmp.path));
}

// ─── build_and_render ─────────────────────────────────────────────

TEST_CASE("build_and_render — missing script never reaches the renderer", "[render]") {
    RenderFixture f;
    f.inputs.script = "missing.script.json";

    auto handoff = f.handoff();
    REQUIRE_THROWS_AS(handoff.build_and_render(f.inputs, f.options, f.tmp.path),
                      MissingArtifactError);
    REQUIRE(f.renderer.requests.empty());
    REQUIRE(f.encoder.encoded.empty());
    REQUIRE_FALSE(fs::exists(f.tmp.path / "frames"));
}

TEST_CASE("build_and_render — renders, encodes, returns absolute output", "[render]") {
    RenderFixture f;
    auto handoff = f.handoff();
    auto output = handoff.build_and_render(f.inputs, f.options, f.tmp.path);

    REQUIRE(output == f.tmp.path / "out" / "intro.mp4");
    REQUIRE(output.is_absolute());
    REQUIRE(fs::exists(output));
    REQUIRE(f.renderer.requests.size() == 1);
    REQUIRE(f.encoder.encoded.size() == 1);
    REQUIRE(f.encoder.encoded[0].frame_count == 10);
    REQUIRE(fs::is_directory(f.tmp.path / "frames"));
}

TEST_CASE("build_and_render — stale frames are removed unless --no-clean", "[render]") {
    RenderFixture f;
    auto stale = test::write_file(f.tmp.path / "frames" / "frame-000999.png", "old");

    SECTION("clean") {
        auto handoff = f.handoff();
        handoff.build_and_render(f.inputs, f.options, f.tmp.path);
        REQUIRE_FALSE(fs::exists(stale));
    }
    SECTION("no clean") {
        f.options.clean_frames = false;
        auto handoff = f.handoff();
        handoff.build_and_render(f.inputs, f.options, f.tmp.path);
        REQUIRE(fs::exists(stale));
    }
}

TEST_CASE("build_and_render — cleaning keeps inputs and unrelated files", "[render]") {
    RenderFixture f;
    auto notes = test::write_file(f.tmp.path / "frames" / "notes.txt", "keep");
    auto nested = test::write_file(f.tmp.path / "frames" / "raw" / "frame-000001.png", "keep");
    auto frame = test::write_file(f.tmp.path / "frames" / "frame-000001.png", "old");

    auto handoff = f.handoff();
    handoff.build_and_render(f.inputs, f.options, f.tmp.path);

    REQUIRE_FALSE(fs::exists(frame));
    REQUIRE(fs::exists(notes));
    REQUIRE(fs::exists(nested));
}

TEST_CASE("build_request — frames directory holding inputs or cwd is refused", "[render]") {
    RenderFixture f;
    test::write_file(f.tmp.path / "precious.txt", "data");

    SECTION("cwd itself") {
        f.options.frames_dir  = ".";
        f.options.output_path = "../out.mp4";
    }
    SECTION("parent of cwd") {
        f.options.frames_dir  = "..";
        f.options.output_path = "/elsewhere/out.mp4";
    }
    SECTION("directory holding the audio") {
        test::write_file(f.tmp.path / "audio" / "voice.wav", "RIFF");
        f.inputs.audio       = fs::path("audio/voice.wav");
        f.options.frames_dir = "audio";
    }
    SECTION("directory holding the timeline") {
        test::write_file(f.tmp.path / "gen" / "intro.timeline.json", "{}");
        f.inputs.timeline    = fs::path("gen/intro.timeline.json");
        f.options.frames_dir = "gen";
    }

    auto handoff = f.handoff();
    REQUIRE_THROWS_AS(handoff.build_and_render(f.inputs, f.options, f.tmp.path), ValidationError);
    REQUIRE(f.renderer.requests.empty());
    REQUIRE(f.encoder.encoded.empty());
    REQUIRE(fs::exists(f.tmp.path / "intro.script.json"));
    REQUIRE(fs::exists(f.tmp.path / "intro.wav"));
    REQUIRE(fs::exists(f.tmp.path / "precious.txt"));
}

TEST_CASE("build_request — frames in cwd are allowed with --no-clean", "[render]") {
    RenderFixture f;
    f.options.frames_dir   = ".";
    f.options.output_path  = "out.mp4";
    f.options.clean_frames = false;
    REQUIRE_NOTHROW(f.handoff().build_request(f.inputs, f.options, f.tmp.path));
}

TEST_CASE("clean_frames_dir creates a missing directory", "[render]") {
    test::TempDir tmp;
    clean_frames_dir(tmp.path / "a" / "frames", "frame-%06d.png");
    REQUIRE(fs::is_directory(tmp.path / "a" / "frames"));
    REQUIRE(fs::is_empty(tmp.path / "a" / "frames"));
}

TEST_CASE("matches_frame_pattern", "[render]") {
    REQUIRE(matches_frame_pattern("frame-000001.png", "frame-%06d.png"));
    REQUIRE(matches_frame_pattern("frame-1234567.png", "frame-%06d.png"));
    REQUIRE(matches_frame_pattern("shot42.jpg", "shot%d.jpg"));

    REQUIRE_FALSE(matches_frame_pattern("frame-.png", "frame-%06d.png"));
    REQUIRE_FALSE(matches_frame_pattern("frame-00a001.png", "frame-%06d.png"));
    REQUIRE_FALSE(matches_frame_pattern("frame-000001.png.bak", "frame-%06d.png"));
    REQUIRE_FALSE(matches_frame_pattern("intro.script.json", "frame-%06d.png"));
    REQUIRE_FALSE(matches_frame_pattern("voice.wav", "frame-%06d.png"));

    REQUIRE(matches_frame_pattern("still.png", "still.png"));
}

TEST_CASE("RenderInputs::from_artifacts", "[render]") {
    ArtifactPaths artifacts{"/p/s.json", "/p/t.json", "/p/a.wav", "/p/out"};
    auto inputs = RenderInputs::from_artifacts(artifacts);
    REQUIRE(inputs.script == fs::path("/p/s.json"));
    REQUIRE(inputs.timeline == fs::path("/p/t.json"));
    REQUIRE(inputs.audio == fs::path("/p/a.wav"));
}
