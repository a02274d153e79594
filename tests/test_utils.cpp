#include "gvpreview/core/errors.hpp"
#include "gvpreview/core/utils.hpp"
#include "gvpreview/io/image_source.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace gvpreview;

namespace {

void touch(const fs::path& p) {
    fs::create_directories(p.parent_path());
    std::ofstream(p) << "x";
}

} // namespace

TEST_CASE("glob_match_is_case_insensitive_and_literal") {
    REQUIRE(core::glob_match("*.jpg", "a.jpg"));
    REQUIRE(core::glob_match("*.jpg", "A.JPG"));
    REQUIRE_FALSE(core::glob_match("*.jpg", "a.jpeg"));
    REQUIRE_FALSE(core::glob_match("*.jpg", "ajpg"));
    REQUIRE(core::glob_match("CAM?_*.tif", "cam1_x.tif"));
}

TEST_CASE("discover_files_recurses_and_sorts_by_file_name") {
    io::ScratchDirectory tmp("gvpreview_test");
    touch(tmp.path() / "b" / "CAM_2.jpg");
    touch(tmp.path() / "CAM_3.JPG");
    touch(tmp.path() / "a" / "CAM_1.jpg");
    touch(tmp.path() / "notes.txt");

    auto files = core::discover_files(tmp.path(), "*.jpg", true);

    REQUIRE(files.size() == 3);
    REQUIRE(files[0].filename() == "CAM_1.jpg");
    REQUIRE(files[1].filename() == "CAM_2.jpg");
    REQUIRE(files[2].filename() == "CAM_3.JPG");
}

TEST_CASE("discover_files_lists_only_top_level_by_default") {
    io::ScratchDirectory tmp("gvpreview_test");
    touch(tmp.path() / "CAM_1.jpg");
    touch(tmp.path() / "2018_10_25_11" / "CAM_2.jpg");
    touch(tmp.path() / "2018_10_25_12" / "deeper" / "CAM_3.jpg");

    auto files = core::discover_files(tmp.path(), "*.jpg");

    REQUIRE(files.size() == 1);
    REQUIRE(files[0] == tmp.path() / "CAM_1.jpg");
}

TEST_CASE("discover_files_requires_a_directory") {
    REQUIRE_THROWS_AS(core::discover_files("/nonexistent/gvpreview", "*.jpg"), IOError);
}

TEST_CASE("trim_and_to_lower") {
    REQUIRE(core::trim("  colsRight \t") == "colsRight");
    REQUIRE(core::to_lower("ColsLeft") == "colsleft");
}
