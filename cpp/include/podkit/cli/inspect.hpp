#pragma once

#include <string>

#include "podkit/bytes/buffer.hpp"
#include "podkit/cli/options.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::cli {

    // Settings for one podkit-inspect run. The image file is the external
    // buffer; the region is [offset, offset + span) inside it, with span 0
    // meaning "to the end of the image".
    struct InspectConfig {
        std::string image_path;
        u32 offset{0};
        u32 span{0};
        u32 elem_size{4};
        u32 size{0};
        u32 value{0};
        u32 key{0};
        u32 index{0};
        bool has_value{false};
        bool has_key{false};
        bool has_index{false};
        bool verbose{false};
    };

    // Option table shared by every command.
    [[nodiscard]] const OptionSpec* inspect_option_specs(u32* count) noexcept;

    // Fills cfg from parsed options. image_arg (positional) wins over
    // env_image (PODKIT_IMAGE); either may be null. InvalidValue if a number
    // does not fit in 32 bits (aux = option id).
    [[nodiscard]] podkit::core::Status build_inspect_config(const ParsedOptions& opts,
                                                            const char* image_arg,
                                                            const char* env_image,
                                                            InspectConfig* cfg);

    // The configured region of the image.
    [[nodiscard]] podkit::core::Status inspect_region(podkit::bytes::BufferMut image,
                                                      const InspectConfig& cfg,
                                                      podkit::bytes::BufferMut* out) noexcept;

    // Commands over an image held in memory. Dumps append text to *out. Typed
    // commands (seq-push, map-*) use PodU32 elements, keys and values.
    [[nodiscard]] podkit::core::Status run_seq_init(podkit::bytes::BufferMut image, const InspectConfig& cfg) noexcept;
    [[nodiscard]] podkit::core::Status run_seq_dump(podkit::bytes::BufferMut image, const InspectConfig& cfg, std::string* out);
    [[nodiscard]] podkit::core::Status run_seq_push(podkit::bytes::BufferMut image, const InspectConfig& cfg) noexcept;
    [[nodiscard]] podkit::core::Status run_seq_remove(podkit::bytes::BufferMut image,
                                                      const InspectConfig& cfg,
                                                      std::string* out);
    [[nodiscard]] podkit::core::Status run_map_dump(podkit::bytes::BufferMut image, const InspectConfig& cfg, std::string* out);
    [[nodiscard]] podkit::core::Status run_map_put(podkit::bytes::BufferMut image,
                                                   const InspectConfig& cfg,
                                                   std::string* out);
    [[nodiscard]] podkit::core::Status run_map_remove(podkit::bytes::BufferMut image,
                                                      const InspectConfig& cfg,
                                                      std::string* out);

} // namespace podkit::cli
