#ifndef DCMWIRE_ENCODING_COMPRESSION_CODEC_REGISTRY_HPP
#define DCMWIRE_ENCODING_COMPRESSION_CODEC_REGISTRY_HPP

#include "dcmwire/encoding/compression/codec_plugin.hpp"
#include "dcmwire/encoding/transfer_syntax.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcmwire::encoding::compression {

class frame_decoder;
class frame_encoder;

/**
 * @brief Output of a dispatched decode or encode, with the plugin that produced it.
 */
struct dispatch_result {
    compression_result output;
    std::string plugin;
};

/**
 * @brief Ordered set of codec plugins with fallback dispatch.
 *
 * Plugins are tried in registration order; the first one that succeeds
 * wins. A call can be pinned to a single plugin by name. Every failure
 * (error value or exception) of a plugin is recorded, and if no plugin
 * succeeds the failures are reported together.
 *
 * Usage:
 * @code
 * auto registry = codec_registry::with_default_plugins();
 * auto decoded = registry.decode(transfer_syntax::rle_lossless, frame,
 *                                 pixel_attributes::from_dataset(ds));
 * if (decoded.is_ok()) {
 *     auto& pixels = decoded.value().output.data;
 * }
 * @endcode
 */
class codec_registry {
public:
    codec_registry() = default;
    codec_registry(codec_registry&&) noexcept = default;
    codec_registry& operator=(codec_registry&&) noexcept = default;
    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;

    /**
     * @brief Registry with the native RLE plugin followed by the optional
     *        libjpeg, OpenJPEG and CharLS plugins.
     */
    [[nodiscard]] static codec_registry with_default_plugins();

    /// @name Registration
    /// @{

    /**
     * @brief Append a plugin; fails if the name is already taken.
     */
    [[nodiscard]] dcmwire::VoidResult add_plugin(std::unique_ptr<codec_plugin> plugin);

    /**
     * @brief Remove a plugin by name.
     * @return true if a plugin was removed
     */
    bool remove_plugin(std::string_view name);

    [[nodiscard]] const codec_plugin* find_plugin(std::string_view name) const noexcept;

    [[nodiscard]] std::vector<std::string> plugin_names() const;

    /**
     * @brief Plugins that decode (or encode) the transfer syntax, available or not.
     */
    [[nodiscard]] std::vector<const codec_plugin*> plugins_for(const transfer_syntax& syntax,
                                                               bool for_encoding = false) const;

    /**
     * @brief Missing dependencies of the named plugin, empty if it is available.
     */
    [[nodiscard]] std::vector<std::string> missing_dependencies(std::string_view name) const;

    /// @}

    /// @name Dispatch
    /// @{

    /**
     * @brief Choose the plugins to try for a call.
     *
     * @param syntax Transfer syntax of the data
     * @param pinned Restrict to this plugin
     * @param for_encoding Select encoders instead of decoders
     * @return Available plugins in dispatch order, never empty
     */
    [[nodiscard]] dcmwire::Result<std::vector<const codec_plugin*>> select_plugins(
        const transfer_syntax& syntax,
        std::optional<std::string_view> pinned = std::nullopt,
        bool for_encoding = false) const;

    /**
     * @brief Decode one frame with the first plugin that succeeds.
     *
     * The attributes are validated before any plugin is selected or run.
     */
    [[nodiscard]] dcmwire::Result<dispatch_result> decode(
        const transfer_syntax& syntax,
        std::span<const uint8_t> frame,
        const pixel_attributes& attributes,
        std::optional<std::string_view> pinned = std::nullopt,
        const core::warning_handler& on_warning = {}) const;

    /**
     * @brief Encode one native frame with the first plugin that succeeds.
     *
     * The attributes are validated before any plugin is selected or run.
     */
    [[nodiscard]] dcmwire::Result<dispatch_result> encode(
        const transfer_syntax& syntax,
        std::span<const uint8_t> pixel_data,
        const pixel_attributes& attributes,
        const compression_options& options = {},
        std::optional<std::string_view> pinned = std::nullopt) const;

    /// @}

private:
    friend class frame_decoder;
    friend class frame_encoder;

    // The dispatch loops below trust params to be validated already.

    [[nodiscard]] static dcmwire::Result<dispatch_result> decode_with(
        std::span<const codec_plugin* const> plugins,
        std::span<const uint8_t> frame,
        const image_params& params,
        const core::warning_handler& on_warning);

    [[nodiscard]] static dcmwire::Result<dispatch_result> encode_with(
        std::span<const codec_plugin* const> plugins,
        std::span<const uint8_t> pixel_data,
        const image_params& params,
        const compression_options& options);

    /// Run one plugin's decode, turning exceptions into errors
    [[nodiscard]] static codec_result try_decode(const codec_plugin& plugin,
                                                 std::span<const uint8_t> frame,
                                                 const image_params& params,
                                                 const core::warning_handler& on_warning);

    [[nodiscard]] static codec_result try_encode(const codec_plugin& plugin,
                                                 std::span<const uint8_t> pixel_data,
                                                 const image_params& params,
                                                 const compression_options& options);

    std::vector<std::unique_ptr<codec_plugin>> plugins_;
};

/**
 * @brief Join names as "A", "A and B" or "A, B and C".
 */
[[nodiscard]] std::string join_with_and(const std::vector<std::string>& items);

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_CODEC_REGISTRY_HPP
