#include "dcmwire/encoding/compression/codec_registry.hpp"
#include "dcmwire/encoding/compression/jpeg2000_codec.hpp"
#include "dcmwire/encoding/compression/jpeg_baseline_codec.hpp"
#include "dcmwire/encoding/compression/jpeg_ls_codec.hpp"
#include "dcmwire/encoding/compression/rle_codec.hpp"
#include "dcmwire/integration/logger_adapter.hpp"

#include <algorithm>
#include <exception>

namespace dcmwire::encoding::compression {

using integration::logger_adapter;

namespace {

std::string_view action(bool for_encoding) noexcept {
    return for_encoding ? "encode" : "decode";
}

std::string_view role(bool for_encoding) noexcept {
    return for_encoding ? "encoding" : "decoding";
}

bool handles(const codec_plugin& plugin, const transfer_syntax& syntax, bool for_encoding) {
    return for_encoding ? plugin.can_encode(syntax) : plugin.supports(syntax);
}

struct failure {
    std::string plugin;
    std::string message;
};

std::string aggregate_failures(bool for_encoding, const std::vector<failure>& failures) {
    std::string message = "Unable to " + std::string{action(for_encoding)} +
                          " as exceptions were raised by all available plugins:";
    for (const auto& f : failures) {
        message += "\n  " + f.plugin + ": " + f.message;
    }
    return message;
}

}  // namespace

std::string join_with_and(const std::vector<std::string>& items) {
    if (items.empty()) {
        return {};
    }
    if (items.size() == 1) {
        return items.front();
    }
    std::string joined;
    for (std::size_t i = 0; i + 1 < items.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += items[i];
    }
    return joined + " and " + items.back();
}

// ============================================================================
// Registration
// ============================================================================

codec_registry codec_registry::with_default_plugins() {
    codec_registry registry;
    registry.plugins_.push_back(std::make_unique<rle_codec>());
    registry.plugins_.push_back(std::make_unique<jpeg_baseline_codec>());
    registry.plugins_.push_back(std::make_unique<jpeg2000_codec>());
    registry.plugins_.push_back(std::make_unique<jpeg_ls_codec>());
    return registry;
}

dcmwire::VoidResult codec_registry::add_plugin(std::unique_ptr<codec_plugin> plugin) {
    if (!plugin) {
        return dcmwire::dcmwire_void_error(dcmwire::error_codes::plugin_not_found,
                                           "Unable to add an empty plugin");
    }
    if (find_plugin(plugin->name()) != nullptr) {
        return dcmwire::dcmwire_void_error(
            dcmwire::error_codes::plugin_not_found,
            "A plugin named '" + std::string{plugin->name()} + "' has already been added");
    }
    logger_adapter::debug("Registered codec plugin '{}'", plugin->name());
    plugins_.push_back(std::move(plugin));
    return dcmwire::ok();
}

bool codec_registry::remove_plugin(std::string_view name) {
    auto it = std::find_if(plugins_.begin(), plugins_.end(),
                           [name](const auto& plugin) { return plugin->name() == name; });
    if (it == plugins_.end()) {
        return false;
    }
    plugins_.erase(it);
    return true;
}

const codec_plugin* codec_registry::find_plugin(std::string_view name) const noexcept {
    for (const auto& plugin : plugins_) {
        if (plugin->name() == name) {
            return plugin.get();
        }
    }
    return nullptr;
}

std::vector<std::string> codec_registry::plugin_names() const {
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& plugin : plugins_) {
        names.emplace_back(plugin->name());
    }
    return names;
}

std::vector<const codec_plugin*> codec_registry::plugins_for(const transfer_syntax& syntax,
                                                             bool for_encoding) const {
    std::vector<const codec_plugin*> result;
    for (const auto& plugin : plugins_) {
        if (handles(*plugin, syntax, for_encoding)) {
            result.push_back(plugin.get());
        }
    }
    return result;
}

std::vector<std::string> codec_registry::missing_dependencies(std::string_view name) const {
    const auto* plugin = find_plugin(name);
    if (plugin == nullptr) {
        return {};
    }
    return plugin->missing_dependencies();
}

// ============================================================================
// Dispatch
// ============================================================================

dcmwire::Result<std::vector<const codec_plugin*>> codec_registry::select_plugins(
    const transfer_syntax& syntax,
    std::optional<std::string_view> pinned,
    bool for_encoding) const {
    auto candidates = plugins_for(syntax, for_encoding);
    if (candidates.empty()) {
        return dcmwire::dcmwire_error<std::vector<const codec_plugin*>>(
            dcmwire::error_codes::codec_not_supported,
            "No " + std::string{role(for_encoding)} + " plugins are available for '" +
                std::string{syntax.name()} + "' (" + std::string{syntax.uid()} + ")");
    }

    if (pinned) {
        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [&](const codec_plugin* p) { return p->name() == *pinned; });
        if (it == candidates.end()) {
            std::vector<std::string> names;
            for (const auto* p : candidates) {
                names.emplace_back(p->name());
            }
            return dcmwire::dcmwire_error<std::vector<const codec_plugin*>>(
                dcmwire::error_codes::plugin_not_found,
                "No " + std::string{role(for_encoding)} + " plugin named '" +
                    std::string{*pinned} + "' has been added for '" +
                    std::string{syntax.name()} + "', available plugins are: " +
                    join_with_and(names));
        }

        auto missing = (*it)->missing_dependencies();
        if (!missing.empty()) {
            return dcmwire::dcmwire_error<std::vector<const codec_plugin*>>(
                dcmwire::error_codes::plugin_unavailable,
                "Unable to " + std::string{action(for_encoding)} + " with the '" +
                    std::string{*pinned} + "' " + std::string{role(for_encoding)} +
                    " plugin because it's missing dependencies - requires " +
                    join_with_and(missing));
        }
        return dcmwire::ok(std::vector<const codec_plugin*>{*it});
    }

    std::vector<const codec_plugin*> available;
    std::string unavailable;
    for (const auto* plugin : candidates) {
        auto missing = plugin->missing_dependencies();
        if (missing.empty()) {
            available.push_back(plugin);
        } else {
            unavailable += "\n    " + std::string{plugin->name()} + " - requires " +
                           join_with_and(missing);
        }
    }

    if (available.empty()) {
        return dcmwire::dcmwire_error<std::vector<const codec_plugin*>>(
            dcmwire::error_codes::no_plugins_available,
            "Unable to " + std::string{action(for_encoding)} + " because the " +
                std::string{role(for_encoding)} +
                " plugins are all missing dependencies:" + unavailable);
    }
    return dcmwire::ok(std::move(available));
}

codec_result codec_registry::try_decode(const codec_plugin& plugin,
                                        std::span<const uint8_t> frame,
                                        const image_params& params,
                                        const core::warning_handler& on_warning) {
    try {
        return plugin.decode(frame, params, on_warning);
    } catch (const std::exception& e) {
        return dcmwire::dcmwire_error<compression_result>(
            dcmwire::error_codes::decompression_error, e.what());
    }
}

codec_result codec_registry::try_encode(const codec_plugin& plugin,
                                        std::span<const uint8_t> pixel_data,
                                        const image_params& params,
                                        const compression_options& options) {
    try {
        return plugin.encode(pixel_data, params, options);
    } catch (const std::exception& e) {
        return dcmwire::dcmwire_error<compression_result>(
            dcmwire::error_codes::compression_error, e.what());
    }
}

dcmwire::Result<dispatch_result> codec_registry::decode(
    const transfer_syntax& syntax,
    std::span<const uint8_t> frame,
    const pixel_attributes& attributes,
    std::optional<std::string_view> pinned,
    const core::warning_handler& on_warning) const {
    auto params = validate_pixel_attributes(attributes);
    if (params.is_err()) {
        return dcmwire::Result<dispatch_result>::err(params.error());
    }
    auto selected = select_plugins(syntax, pinned, false);
    if (selected.is_err()) {
        return dcmwire::Result<dispatch_result>::err(selected.error());
    }
    return decode_with(selected.value(), frame, params.value(), on_warning);
}

dcmwire::Result<dispatch_result> codec_registry::encode(const transfer_syntax& syntax,
                                                        std::span<const uint8_t> pixel_data,
                                                        const pixel_attributes& attributes,
                                                        const compression_options& options,
                                                        std::optional<std::string_view> pinned) const {
    auto params = validate_pixel_attributes(attributes);
    if (params.is_err()) {
        return dcmwire::Result<dispatch_result>::err(params.error());
    }
    auto selected = select_plugins(syntax, pinned, true);
    if (selected.is_err()) {
        return dcmwire::Result<dispatch_result>::err(selected.error());
    }
    return encode_with(selected.value(), pixel_data, params.value(), options);
}

dcmwire::Result<dispatch_result> codec_registry::decode_with(
    std::span<const codec_plugin* const> plugins,
    std::span<const uint8_t> frame,
    const image_params& params,
    const core::warning_handler& on_warning) {
    std::vector<failure> failures;
    for (const auto* plugin : plugins) {
        auto result = try_decode(*plugin, frame, params, on_warning);
        if (result.is_ok()) {
            return dcmwire::ok(
                dispatch_result{std::move(result.value()), std::string{plugin->name()}});
        }
        logger_adapter::debug("Decoding plugin '{}' failed: {}", plugin->name(),
                              result.error().message);
        failures.push_back({std::string{plugin->name()}, result.error().message});
    }

    return dcmwire::dcmwire_error<dispatch_result>(dcmwire::error_codes::all_plugins_failed,
                                                   aggregate_failures(false, failures));
}

dcmwire::Result<dispatch_result> codec_registry::encode_with(
    std::span<const codec_plugin* const> plugins,
    std::span<const uint8_t> pixel_data,
    const image_params& params,
    const compression_options& options) {
    std::vector<failure> failures;
    for (const auto* plugin : plugins) {
        auto result = try_encode(*plugin, pixel_data, params, options);
        if (result.is_ok()) {
            return dcmwire::ok(
                dispatch_result{std::move(result.value()), std::string{plugin->name()}});
        }
        logger_adapter::debug("Encoding plugin '{}' failed: {}", plugin->name(),
                              result.error().message);
        failures.push_back({std::string{plugin->name()}, result.error().message});
    }

    return dcmwire::dcmwire_error<dispatch_result>(dcmwire::error_codes::all_plugins_failed,
                                                   aggregate_failures(true, failures));
}

}  // namespace dcmwire::encoding::compression
