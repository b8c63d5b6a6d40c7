// End-to-end coverage of the file-level API: JPEG files in, AVI file out.
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "aviforge.hpp"
#include "test_utils.hpp"

using aviforge::AviError;
using aviforge::AviSummary;
using test_utils::make_test_jpeg;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[api_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::vector<std::string> write_frames(const std::filesystem::path &dir, size_t count) {
    std::vector<std::string> paths;
    for (size_t i = 0; i < count; ++i) {
        const auto p = dir / ("frame" + std::to_string(100 + i) + ".jpg");
        // Alternate odd and even scan lengths.
        test_utils::write_file(p, make_test_jpeg(160, 120, 40 + i));
        paths.push_back(p.string());
    }
    return paths;
}

bool test_sync_and_async_files() {
    const auto dir = test_utils::make_temp_dir("api_unit");
    auto frames = write_frames(dir, 9);
    const auto sync_out = (dir / "sync.avi").string();
    const auto async_out = (dir / "async.avi").string();

    auto st = aviforge::write_avi_from_jpegs(frames, {160, 120, 24}, sync_out, false);
    bool ok = check(st.ok, "sync write: " + st.message);
    st = aviforge::write_avi_from_jpegs(frames, {160, 120, 24}, async_out, true);
    ok &= check(st.ok, "async write: " + st.message);

    auto a = test_utils::read_file(sync_out);
    auto b = test_utils::read_file(async_out);
    ok &= check(a && b && *a == *b, "sync and async files identical");

    AviSummary s;
    st = aviforge::read_avi(sync_out, s);
    ok &= check(st.ok && s.avih_total_frames == 9 && s.index_consistent, "file inspects clean");
    ok &= check(s.fps == 24 && s.width == 160 && s.height == 120, "parameters in header");
    std::filesystem::remove_all(dir);
    return ok;
}

bool test_dimension_inference() {
    const auto dir = test_utils::make_temp_dir("api_infer");
    auto frames = write_frames(dir, 2);
    const auto out = (dir / "inferred.avi").string();
    auto st = aviforge::write_avi_from_jpegs(frames, {0, 0, 10}, out);
    bool ok = check(st.ok, "write with inferred size");
    AviSummary s;
    ok &= check(aviforge::read_avi(out, s).ok && s.width == 160 && s.height == 120,
                "size taken from first SOF");

    // Non-JPEG payloads are accepted when the size is given, refused when it must be inferred.
    const auto blob = dir / "blob.jpg";
    test_utils::write_file(blob, {1, 2, 3, 4, 5});
    st = aviforge::write_avi_from_jpegs({blob.string()}, {8, 8, 10}, out);
    ok &= check(st.ok, "opaque payload written");
    st = aviforge::write_avi_from_jpegs({blob.string()}, {0, 0, 10}, out);
    ok &= check(st.error == AviError::InvalidConfig, "cannot infer size from opaque payload");
    std::filesystem::remove_all(dir);
    return ok;
}

bool test_failures() {
    const auto dir = test_utils::make_temp_dir("api_fail");
    auto frames = write_frames(dir, 3);
    frames.insert(frames.begin() + 1, (dir / "missing.jpg").string());
    const auto out = (dir / "out.avi").string();

    auto st = aviforge::write_avi_from_jpegs(frames, {160, 120, 24}, out, false);
    bool ok = check(st.error == AviError::Io, "missing frame fails sync write");
    st = aviforge::write_avi_from_jpegs(frames, {160, 120, 24}, out, true);
    ok &= check(st.error == AviError::Io, "missing frame fails async write");

    st = aviforge::write_avi_from_jpegs({frames[0]}, {160, 120, 0}, out);
    ok &= check(st.error == AviError::InvalidFrameSize, "fps 0");
    st = aviforge::write_avi_from_jpegs({frames[0]}, {160, 120, 24}, "");
    ok &= check(st.error == AviError::InvalidConfig, "no output path");
    st = aviforge::write_avi_from_jpegs({frames[0]}, {160, 120, 24},
                                        (dir / "no-such-dir" / "x.avi").string());
    ok &= check(st.error == AviError::Io, "unwritable output");
    std::filesystem::remove_all(dir);
    return ok;
}

bool test_job_file() {
    const auto dir = test_utils::make_temp_dir("api_job");
    write_frames(dir, 4);
    const auto job_path = dir / "job.json";
    const std::string job =
        R"({"fps":5,"frames":["frame100.jpg","frame101.jpg","frame102.jpg","frame103.jpg"],)"
        R"("output":"job.avi","async":true})";
    test_utils::write_file(job_path, std::vector<uint8_t>(job.begin(), job.end()));

    auto st = aviforge::write_avi_from_job(job_path.string());
    bool ok = check(st.ok, "job runs: " + st.message);
    AviSummary s;
    ok &= check(aviforge::read_avi((dir / "job.avi").string(), s).ok && s.avih_total_frames == 4 &&
                    s.fps == 5 && s.width == 160,
                "job output relative to job file");

    const auto override_out = (dir / "override.avi").string();
    st = aviforge::write_avi_from_job(job_path.string(), override_out);
    ok &= check(st.ok && std::filesystem::exists(override_out), "output override");

    const auto no_output = dir / "no_output.json";
    const std::string job2 = R"({"frames":["frame100.jpg"]})";
    test_utils::write_file(no_output, std::vector<uint8_t>(job2.begin(), job2.end()));
    st = aviforge::write_avi_from_job(no_output.string());
    ok &= check(st.error == AviError::InvalidConfig, "job without output");

    st = aviforge::write_avi_from_job((dir / "missing.json").string());
    ok &= check(st.error == AviError::Io, "missing job file");
    std::filesystem::remove_all(dir);
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= check(!aviforge::version_string().empty(), "version string");
    ok &= test_sync_and_async_files();
    ok &= test_dimension_inference();
    ok &= test_failures();
    ok &= test_job_file();
    return ok ? 0 : 1;
}
