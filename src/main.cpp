/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "fig2json.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool raw = false;
    bool transformed = true;
    bool schema = false;
    bool extras = false;
    bool keep_ids = false;
    bool unknown = false;
    bool compact = false;
    bool debug = false;
    std::string root = "Message";
    std::optional<fs::path> out_dir;
    std::optional<fs::path> zstd_path;
};

static void print_usage() {
    FIG2JSON_LOG_INFO(
        "Usage:\n" \
        "    fig2json <file-or-dir> [--raw] [--both] [--schema] [--extras] [--keep-ids] [--unknown]\n" \
        "             [--compact] [--root <name>] [--out <dir>] [--zstd <path>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a .fig file or a directory (searched recursively)\n" \
        "    Schema and data chunks must use the tagged kiwi encoding (wire kind in every key);\n" \
        "    files saved by Figma's own kiwi writer are not supported\n" \
        "    --raw         writes the untransformed decoded tree instead of the cleaned one\n" \
        "    --both        writes the cleaned tree and the untransformed tree (_raw.json)\n" \
        "    --schema      also writes the embedded schema (_schema.json)\n" \
        "    --extras      keeps thumbnails and bookkeeping fields under __extras\n" \
        "    --keep-ids    keeps node ids and guids in the cleaned tree\n" \
        "    --unknown     keeps fields the schema does not declare as __unknown_<tag>\n" \
        "    --compact     writes JSON without indentation\n" \
        "    --root        root definition name (default Message)\n" \
        "    --out         output directory (default <exe dir>/output/json)\n" \
        "    --zstd        path to the zstd shared library\n" \
        "    --debug       enables extra logging\n"
    );
}

static void write_json(const fs::path& path, const nlohmann::ordered_json& j, const Settings& settings) {
    const int indent = settings.compact ? -1 : 2;
    fig2json::fs_utils::write_text_file(
        path, j.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
    );
    FIG2JSON_LOG_INFO(
        "Wrote: %s", fig2json::fs_utils::display_path(path, fs::current_path()).c_str()
    );
}

static void process_file(
    const fs::path& path,
    const fs::path& input_root,
    const fs::path& out_dir,
    const Settings& settings
) {
    if (!fig2json::fs_utils::is_fig_file(path)) {
        FIG2JSON_LOG_INFO("Skipped: %s", path.string().c_str());
        return;
    }

    const auto target = [&](std::string_view suffix) {
        return fig2json::fs_utils::output_path(out_dir, path, input_root, suffix);
    };
    try {
        fig2json::ConvertOptions opt{};
        opt.root_type = settings.root;
        opt.want_transformed = settings.transformed;
        opt.want_raw = settings.raw;
        opt.want_schema = settings.schema;
        opt.keep_raw_extras = settings.extras;
        opt.keep_ids = settings.keep_ids;
        opt.keep_unknown_fields = settings.unknown;
        opt.zstd_path = settings.zstd_path;
        opt.debug = settings.debug;
        const auto res = fig2json::FigConverter::ConvertFigFile(path, opt);

        if (settings.transformed) {
            write_json(target(".json"), res.transformed, settings);
        }
        if (settings.raw) {
            write_json(target(settings.transformed ? "_raw.json" : ".json"), res.raw, settings);
        }
        if (settings.schema) {
            write_json(target("_schema.json"), res.schema, settings);
        }
        if (settings.debug && !res.assets.empty()) {
            FIG2JSON_LOG_DEBUG(
                "%s: %zu assets in archive", path.filename().string().c_str(), res.assets.size()
            );
        }
    } catch (const std::exception& e) {
        FIG2JSON_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        FIG2JSON_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--raw") {
            settings.raw = true;
            settings.transformed = false;
            continue;
        }
        if (arg == "--both") {
            settings.raw = true;
            settings.transformed = true;
            continue;
        }
        if (arg == "--schema") {
            settings.schema = true;
            continue;
        }
        if (arg == "--extras") {
            settings.extras = true;
            continue;
        }
        if (arg == "--keep-ids") {
            settings.keep_ids = true;
            continue;
        }
        if (arg == "--unknown") {
            settings.unknown = true;
            continue;
        }
        if (arg == "--compact") {
            settings.compact = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--root" || arg == "--out" || arg == "--zstd") {
            if (i + 1 >= argc) {
                FIG2JSON_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            const std::string value = argv[++i];
            if (arg == "--root") {
                settings.root = value;
            } else if (arg == "--out") {
                settings.out_dir = fs::path(value);
            } else {
                settings.zstd_path = fs::path(value);
            }
            continue;
        }
        FIG2JSON_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        FIG2JSON_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }
    fig2json::log::set_debug(settings.debug);

    const fs::path out_dir =
        settings.out_dir ? *settings.out_dir : fig2json::fs_utils::executable_dir() / "output" / "json";
    std::vector<fs::path> inputs;
    try {
        fig2json::fs_utils::ensure_dir(out_dir);
        inputs = fs::is_directory(input) ? fig2json::fs_utils::collect_inputs(input)
                                         : std::vector<fs::path>{input};
    } catch (const std::exception& e) {
        FIG2JSON_LOG_ERROR("%s", e.what());
        return 2;
    }

    // Single files land directly in out_dir; directory inputs keep their sub-folders.
    const fs::path input_root = fs::is_directory(input) ? input : fs::path();
    for (const auto& p : inputs) {
        process_file(p, input_root, out_dir, settings);
    }
    return 0;
}
