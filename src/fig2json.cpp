/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "fig2json.h"

#include "fig/fig_archive.h"
#include "kiwi/kiwi_schema_decoder.h"
#include "kiwi/kiwi_value_json.h"
#include "tree/node_json.h"
#include "tree/transform_pipeline.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>

namespace fig2json {

static long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - since
    )
                                      .count());
}

ConvertResult FigConverter::ConvertFigFile(const std::filesystem::path& path, const ConvertOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("Fig file is empty: " + path.string());
    }
    return ConvertFigBytes(bytes, opt, path.filename().string());
}

ConvertResult FigConverter::ConvertFigBytes(
    std::span<const std::uint8_t> bytes,
    const ConvertOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const fig::FigArchive archive = fig::parse_fig_archive(bytes, {opt.zstd_path, opt.debug});
    if (opt.debug) {
        FIG2JSON_LOG_DEBUG(
            "%s: container read in %lldms", std::string(label).c_str(), elapsed_ms(t0)
        );
    }

    ConvertResult result = ConvertKiwiBlobs(archive.schema, archive.data, opt, label);
    result.file_kind = std::string(fig::file_kind_name(archive.kind));
    result.version = archive.version;
    for (const auto& asset : archive.assets) {
        result.assets.push_back(asset.name);
    }
    return result;
}

ConvertResult FigConverter::ConvertKiwiBlobs(
    std::span<const std::uint8_t> schema_bytes,
    std::span<const std::uint8_t> data_bytes,
    const ConvertOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const kiwi::Schema schema = kiwi::decode_schema(schema_bytes, opt.debug);
    const kiwi::TypeId root_type = kiwi::find_root_type(schema, opt.root_type);

    kiwi::DecodeOptions decode_opt;
    decode_opt.keep_unknown_fields = opt.keep_unknown_fields;
    decode_opt.debug = opt.debug;

    ConvertResult result{};
    const kiwi::Value root =
        kiwi::decode_value(schema, data_bytes, root_type, decode_opt, &result.decode_stats);
    const auto t1 = std::chrono::steady_clock::now();

    if (opt.want_schema) {
        result.schema = kiwi::schema_to_json(schema);
    }
    if (opt.want_raw) {
        result.raw = kiwi::value_to_json(root);
    }
    if (opt.want_transformed) {
        tree::BuildOptions build_opt;
        build_opt.keep_raw_extras = opt.keep_raw_extras;
        build_opt.debug = opt.debug;
        tree::BuildResult built = tree::build_node_tree(root, build_opt);
        result.build_stats = built.stats;

        tree::TransformConfig cfg;
        cfg.keep_ids = opt.keep_ids;
        const tree::TransformPipeline pipeline(std::move(cfg));
        const tree::Node out = pipeline.run(built.root);
        result.transformed = tree::document_to_json(out, built.document_extras);
    }

    if (opt.debug) {
        FIG2JSON_LOG_DEBUG(
            "%s: %zu definitions, %zu records, %zu unknown fields skipped, %zu enum values "
            "kept; decode %lldms, total %lldms",
            std::string(label).c_str(), schema.size(), result.decode_stats.records,
            result.decode_stats.skipped_unknown_fields, result.decode_stats.preserved_enum_values,
            static_cast<long long>(
                std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
            ),
            elapsed_ms(t0)
        );
    }
    return result;
}

}  // namespace fig2json
