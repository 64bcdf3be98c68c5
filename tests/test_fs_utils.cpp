#include <gtest/gtest.h>
#include "utils/encoding.h"
#include "utils/fs_utils.h"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;
using namespace fig2json;

TEST(FsUtilsTest, RecognizesFigExtensionCaseInsensitively) {
    EXPECT_TRUE(fs_utils::is_fig_file("design.fig"));
    EXPECT_TRUE(fs_utils::is_fig_file("DESIGN.FIG"));
    EXPECT_FALSE(fs_utils::is_fig_file("design.figma"));
    EXPECT_FALSE(fs_utils::is_fig_file("fig"));
}

TEST(FsUtilsTest, OutputPathMirrorsInputFolders) {
    EXPECT_EQ(
        fs_utils::output_path("out", "in/team/a.fig", "in", "_raw.json").string(),
        (fs::path("out") / "team" / "a_raw.json").string()
    );
    EXPECT_EQ(
        fs_utils::output_path("out", "in/a.fig", "in", ".json").string(),
        (fs::path("out") / "a.json").string()
    );
    EXPECT_EQ(
        fs_utils::output_path("out", "/x/y/a.fig", "", ".json").string(),
        (fs::path("out") / "a.json").string()
    );
}

TEST(FsUtilsTest, CollectsFigFilesSorted) {
    const fs::path root = fs::temp_directory_path() / "fig2json_fs_utils_test";
    fs::remove_all(root);
    const std::vector<std::uint8_t> bytes{1, 2, 3};
    fs_utils::write_file(root / "b.fig", bytes);
    fs_utils::write_file(root / "nested" / "a.fig", bytes);
    fs_utils::write_text_file(root / "notes.txt", "x");

    const auto inputs = fs_utils::collect_inputs(root);
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].filename().string(), "b.fig");
    EXPECT_EQ(inputs[1].filename().string(), "a.fig");
    EXPECT_EQ(fs_utils::read_file(inputs[1]), bytes);
    EXPECT_EQ(fs_utils::display_path(inputs[1], root), (fs::path("nested") / "a.fig").string());

    fs::remove_all(root);
}

TEST(FsUtilsTest, ReadingMissingFileThrows) {
    EXPECT_THROW(fs_utils::read_file("/nonexistent/fig2json/none.fig"), std::runtime_error);
}

TEST(EncodingTest, HexAndBase64) {
    const std::vector<std::uint8_t> bytes{0x00, 0x9f, 0xff};
    EXPECT_EQ(encoding::to_hex_lower(bytes), "009fff");
    EXPECT_EQ(encoding::to_base64(bytes), "AJ//");
    EXPECT_EQ(encoding::to_base64(std::vector<std::uint8_t>{'M', 'a'}), "TWE=");
    EXPECT_EQ(encoding::to_base64(std::vector<std::uint8_t>{}), "");
}
