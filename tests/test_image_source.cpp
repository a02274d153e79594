#include "gvpreview/core/errors.hpp"
#include "gvpreview/io/image_source.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace gvpreview;
using gvpreview::testing::camera_filename;
using gvpreview::testing::write_solid_image;
using gvpreview::testing::write_tar;

TEST_CASE("image_source_lists_directory_case_insensitively") {
    io::ScratchDirectory tmp("gvpreview_test");
    write_solid_image(tmp.path() / camera_filename(2), 8, 8, cv::Scalar(1, 2, 3));
    write_solid_image(tmp.path() / camera_filename(1, "JPG"), 8, 8, cv::Scalar(1, 2, 3));
    write_solid_image(tmp.path() / camera_filename(3, "tif"), 8, 8, cv::Scalar(1, 2, 3));
    std::ofstream(tmp.path() / "README.txt") << "not an image";

    auto source = io::ImageSource::open(tmp.path(), ImageFormat::JPG);

    REQUIRE_FALSE(source.from_archive());
    REQUIRE(source.root() == tmp.path());
    REQUIRE(source.files().size() == 2);
    REQUIRE(source.files()[0].filename() == camera_filename(1, "JPG"));
    REQUIRE(source.files()[1].filename() == camera_filename(2));
}

TEST_CASE("image_source_ignores_capture_subfolders_of_a_directory") {
    io::ScratchDirectory tmp("gvpreview_test");
    write_solid_image(tmp.path() / camera_filename(3), 8, 8, cv::Scalar(1, 2, 3));
    write_solid_image(tmp.path() / "2018_10_25_11" / camera_filename(1), 8, 8, cv::Scalar(1, 2, 3));
    write_solid_image(tmp.path() / "2018_10_25_12" / camera_filename(1), 8, 8, cv::Scalar(1, 2, 3));

    auto source = io::ImageSource::open(tmp.path(), ImageFormat::JPG);

    REQUIRE(source.files().size() == 1);
    REQUIRE(source.files()[0] == tmp.path() / camera_filename(3));
}

TEST_CASE("image_source_extracts_archive_into_scratch_directory") {
    io::ScratchDirectory tmp("gvpreview_test");
    const fs::path a = tmp.path() / "src" / camera_filename(1);
    const fs::path b = tmp.path() / "src" / camera_filename(2);
    write_solid_image(a, 8, 8, cv::Scalar(1, 2, 3));
    write_solid_image(b, 8, 8, cv::Scalar(1, 2, 3));

    const fs::path tar = tmp.path() / "hour.tar";
    write_tar(tar, {{"kioloa/" + camera_filename(2), b},
                    {"kioloa/" + camera_filename(1), a},
                    {"kioloa/notes.txt", a}});

    fs::path root;
    {
        auto source = io::ImageSource::open(tar, ImageFormat::JPG);

        REQUIRE(source.from_archive());
        REQUIRE(source.input() == tar);
        root = source.root();
        REQUIRE(fs::is_directory(root));
        REQUIRE(source.files().size() == 2);
        REQUIRE(source.files()[0].filename() == camera_filename(1));
        REQUIRE(source.display_name(source.files()[0]) == "kioloa/" + camera_filename(1));
    }
    REQUIRE_FALSE(fs::exists(root));
}

TEST_CASE("extract_archive_flattens_escaping_entry_paths") {
    io::ScratchDirectory tmp("gvpreview_test");
    const fs::path a = tmp.path() / camera_filename(1);
    write_solid_image(a, 8, 8, cv::Scalar(1, 2, 3));
    const fs::path tar = tmp.path() / "evil.tar";
    write_tar(tar, {{"../../" + camera_filename(1), a}});

    io::ScratchDirectory out("gvpreview_test_out");
    auto result = io::extract_archive(tar, out.path());
    REQUIRE(result.extracted == 1);
    REQUIRE(result.warnings.empty());
    REQUIRE(fs::exists(out.path() / camera_filename(1)));
}

TEST_CASE("extract_archive_resolves_hard_links_inside_output") {
    io::ScratchDirectory tmp("gvpreview_test");
    const fs::path a = tmp.path() / camera_filename(1);
    write_solid_image(a, 8, 8, cv::Scalar(1, 2, 3));
    const fs::path tar = tmp.path() / "linked.tar";
    write_tar(tar, {{"GV01/" + camera_filename(1), a, ""},
                    {"GV01/" + camera_filename(2), {}, "GV01/" + camera_filename(1)}});

    io::ScratchDirectory out("gvpreview_test_out");
    auto result = io::extract_archive(tar, out.path());

    REQUIRE(result.warnings.empty());
    REQUIRE(result.extracted == 2);
    REQUIRE(fs::file_size(out.path() / "GV01" / camera_filename(2)) ==
            fs::file_size(a));
    REQUIRE(fs::hard_link_count(out.path() / "GV01" / camera_filename(1)) == 2);
}

TEST_CASE("extract_archive_skips_unwritable_entries_with_warning") {
    io::ScratchDirectory tmp("gvpreview_test");
    const fs::path a = tmp.path() / camera_filename(1);
    write_solid_image(a, 8, 8, cv::Scalar(1, 2, 3));
    const fs::path tar = tmp.path() / "clash.tar";
    // The second entry wants a file where the first one created a non-empty folder.
    write_tar(tar, {{"GV01/blocked.jpg/" + camera_filename(2), a, ""},
                    {"GV01/blocked.jpg", a, ""},
                    {"GV01/" + camera_filename(1), a, ""}});

    io::ScratchDirectory out("gvpreview_test_out");
    auto result = io::extract_archive(tar, out.path());

    REQUIRE(result.extracted == 2);
    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings[0].find("GV01/blocked.jpg") != std::string::npos);
    REQUIRE(fs::exists(out.path() / "GV01" / camera_filename(1)));
}

TEST_CASE("extract_archive_honours_stop_flag") {
    io::ScratchDirectory tmp("gvpreview_test");
    const fs::path a = tmp.path() / camera_filename(1);
    write_solid_image(a, 8, 8, cv::Scalar(1, 2, 3));
    const fs::path tar = tmp.path() / "hour.tar";
    write_tar(tar, {{camera_filename(1), a}});

    std::atomic<bool> stop{true};
    io::ScratchDirectory out("gvpreview_test_out");
    REQUIRE_THROWS_AS(io::extract_archive(tar, out.path(), &stop), StopRequested);
}

TEST_CASE("image_source_rejects_missing_or_unreadable_input") {
    REQUIRE_THROWS_AS(io::ImageSource::open("/nonexistent/gvpreview.tar", ImageFormat::JPG),
                      IOError);

    io::ScratchDirectory tmp("gvpreview_test");
    const fs::path bogus = tmp.path() / "bogus.tar";
    {
        std::ofstream out(bogus, std::ios::binary);
        const char junk[] = {'\x13', '\x37', '\x00', '\x7f', '\x01', '\x02', '\x03', '\x04'};
        out.write(junk, sizeof(junk));
    }
    REQUIRE_THROWS_AS(io::ImageSource::open(bogus, ImageFormat::JPG), IOError);
}

TEST_CASE("scratch_directory_is_removed_on_destruction") {
    fs::path p;
    {
        io::ScratchDirectory tmp("gvpreview_test");
        p = tmp.path();
        std::ofstream(p / "file") << "x";
        REQUIRE(fs::exists(p / "file"));
    }
    REQUIRE_FALSE(fs::exists(p));
}
