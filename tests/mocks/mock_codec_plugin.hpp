/**
 * @file mock_codec_plugin.hpp
 * @brief Scriptable codec_plugin for registry and frame decoder tests
 */

#pragma once

#include <dcmwire/encoding/compression/codec_plugin.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dcmwire::encoding::compression::testing {

/**
 * @brief How the mock responds to decode and encode calls
 */
enum class mock_behavior {
    succeed,  ///< Return the configured output (or the input, if none is set)
    fail,     ///< Return an error result
    raise     ///< Throw std::runtime_error
};

/**
 * @brief codec_plugin whose availability and outcome are set by the test
 *
 * The decode and encode outputs can be replaced per call with callbacks,
 * which lets a test vary the result from frame to frame.
 */
class mock_codec_plugin final : public codec_plugin {
public:
    using decode_callback =
        std::function<codec_result(std::span<const uint8_t>, const image_params&)>;
    using encode_callback = decode_callback;

    mock_codec_plugin(std::string name, std::vector<transfer_syntax> syntaxes)
        : name_(std::move(name)), syntaxes_(std::move(syntaxes)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] bool supports(const transfer_syntax& syntax) const noexcept override {
        for (const auto& ts : syntaxes_) {
            if (ts == syntax) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] bool can_encode(const transfer_syntax& syntax) const noexcept override {
        return encoder_ && supports(syntax);
    }

    [[nodiscard]] std::vector<std::string> missing_dependencies() const override {
        return missing_;
    }

    [[nodiscard]] codec_result decode(std::span<const uint8_t> frame,
                                      const image_params& params,
                                      const core::warning_handler& on_warning) const override {
        ++decode_calls_;
        if (!warning_.empty()) {
            core::report_warning(on_warning, warning_);
        }
        switch (behavior_) {
            case mock_behavior::fail:
                return dcmwire::dcmwire_error<compression_result>(
                    dcmwire::error_codes::decompression_error, failure_message_);
            case mock_behavior::raise:
                throw std::runtime_error(failure_message_);
            case mock_behavior::succeed:
                break;
        }
        if (callback_) {
            return callback_(frame, params);
        }
        compression_result result;
        result.data.assign(frame.begin(), frame.end());
        result.output_params = params;
        return dcmwire::ok(std::move(result));
    }

    [[nodiscard]] codec_result encode(std::span<const uint8_t> pixel_data,
                                      const image_params& params,
                                      const compression_options& /*options*/) const override {
        ++encode_calls_;
        switch (behavior_) {
            case mock_behavior::fail:
                return dcmwire::dcmwire_error<compression_result>(
                    dcmwire::error_codes::compression_error, failure_message_);
            case mock_behavior::raise:
                throw std::runtime_error(failure_message_);
            case mock_behavior::succeed:
                break;
        }
        if (encode_callback_) {
            return encode_callback_(pixel_data, params);
        }
        compression_result result;
        result.data.assign(pixel_data.begin(), pixel_data.end());
        result.output_params = params;
        return dcmwire::ok(std::move(result));
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    auto set_behavior(mock_behavior behavior, std::string message = "mock failure")
        -> mock_codec_plugin& {
        behavior_ = behavior;
        failure_message_ = std::move(message);
        return *this;
    }

    auto set_missing(std::vector<std::string> missing) -> mock_codec_plugin& {
        missing_ = std::move(missing);
        return *this;
    }

    auto set_encoder(bool enabled) -> mock_codec_plugin& {
        encoder_ = enabled;
        return *this;
    }

    auto set_callback(decode_callback callback) -> mock_codec_plugin& {
        callback_ = std::move(callback);
        return *this;
    }

    auto set_encode_callback(encode_callback callback) -> mock_codec_plugin& {
        encode_callback_ = std::move(callback);
        return *this;
    }

    auto set_warning(std::string warning) -> mock_codec_plugin& {
        warning_ = std::move(warning);
        return *this;
    }

    [[nodiscard]] auto decode_calls() const noexcept -> int { return decode_calls_.load(); }
    [[nodiscard]] auto encode_calls() const noexcept -> int { return encode_calls_.load(); }

private:
    std::string name_;
    std::vector<transfer_syntax> syntaxes_;
    std::vector<std::string> missing_;
    mock_behavior behavior_{mock_behavior::succeed};
    std::string failure_message_{"mock failure"};
    bool encoder_{false};
    decode_callback callback_;
    encode_callback encode_callback_;
    std::string warning_;
    mutable std::atomic<int> decode_calls_{0};
    mutable std::atomic<int> encode_calls_{0};
};

/**
 * @brief Creates a mock and keeps a raw pointer for inspection after the
 * registry takes ownership.
 */
inline auto make_mock(std::string name, std::vector<transfer_syntax> syntaxes,
                      mock_codec_plugin*& observer) -> std::unique_ptr<codec_plugin> {
    auto plugin = std::make_unique<mock_codec_plugin>(std::move(name), std::move(syntaxes));
    observer = plugin.get();
    return plugin;
}

}  // namespace dcmwire::encoding::compression::testing
