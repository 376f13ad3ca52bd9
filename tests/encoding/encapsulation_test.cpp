/**
 * @file encapsulation_test.cpp
 * @brief Unit tests for encapsulated Pixel Data framing
 */

#include <dcmwire/encoding/encapsulation.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

using namespace dcmwire::encoding;
using Catch::Matchers::ContainsSubstring;

namespace {

std::vector<uint8_t> sequential_bytes(std::size_t size, uint8_t first = 0) {
    std::vector<uint8_t> data(size);
    std::iota(data.begin(), data.end(), first);
    return data;
}

std::vector<std::vector<uint8_t>> sample_frames() {
    return {sequential_bytes(10, 0x10), sequential_bytes(6, 0x40), sequential_bytes(20, 0x80)};
}

/**
 * @brief Collects every frame yielded by a frame_iterator.
 */
std::vector<std::vector<uint8_t>> iterate_all(std::span<const uint8_t> encapsulated,
                                              const frame_options& options) {
    memory_source source{encapsulated};
    auto iterator = frame_iterator::create(source, options);
    REQUIRE(iterator.is_ok());

    std::vector<std::vector<uint8_t>> frames;
    while (true) {
        auto frame = iterator.value().next();
        REQUIRE(frame.is_ok());
        if (!frame.value()) {
            break;
        }
        frames.push_back(std::move(*frame.value()));
    }
    return frames;
}

std::vector<uint8_t> empty_bot() {
    return {0xFE, 0xFF, 0x00, 0xE0, 0x00, 0x00, 0x00, 0x00};
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace

// ============================================================================
// Writing
// ============================================================================

TEST_CASE("encapsulate produces the expected item stream", "[encoding][encapsulation]") {
    SECTION("single frame without a Basic Offset Table") {
        std::vector<std::vector<uint8_t>> frames{{0xFE, 0xFF, 0x00, 0xE1}};
        auto encapsulated = encapsulate(frames, 1, false);
        REQUIRE(encapsulated.is_ok());

        const std::vector<uint8_t> expected{
            0xFE, 0xFF, 0x00, 0xE0, 0x00, 0x00, 0x00, 0x00,
            0xFE, 0xFF, 0x00, 0xE0, 0x04, 0x00, 0x00, 0x00,
            0xFE, 0xFF, 0x00, 0xE1};
        CHECK(encapsulated.value() == expected);
    }

    SECTION("the delimiter is only appended on request") {
        std::vector<std::vector<uint8_t>> frames{{1, 2}};
        auto encapsulated = encapsulate(frames, 1, false, true);
        REQUIRE(encapsulated.is_ok());
        const auto& bytes = encapsulated.value();
        REQUIRE(bytes.size() == 8 + 10 + 8);
        const std::vector<uint8_t> delimiter{0xFE, 0xFF, 0xDD, 0xE0, 0, 0, 0, 0};
        CHECK(std::vector<uint8_t>(bytes.end() - 8, bytes.end()) == delimiter);
    }

    SECTION("odd length frames are padded") {
        std::vector<std::vector<uint8_t>> frames{{1, 2, 3}};
        auto encapsulated = encapsulate(frames, 1, false);
        REQUIRE(encapsulated.is_ok());
        const auto& bytes = encapsulated.value();
        REQUIRE(bytes.size() == 8 + 8 + 4);
        CHECK(bytes[12] == 4);
        CHECK(bytes.back() == 0);
    }
}

TEST_CASE("Basic Offset Table matches the scanned fragment offsets",
          "[encoding][encapsulation]") {
    const auto frames = sample_frames();

    for (std::size_t fragments_per_frame : {1u, 2u, 3u}) {
        auto encapsulated = encapsulate(frames, fragments_per_frame, true);
        REQUIRE(encapsulated.is_ok());

        memory_source source{encapsulated.value()};
        auto bot = parse_basic_offsets(source);
        REQUIRE(bot.is_ok());
        REQUIRE(bot.value().size() == frames.size());
        const auto fragments_start = source.tell();

        auto scan = parse_fragments(source);
        REQUIRE(scan.is_ok());
        CHECK(source.tell() == fragments_start);
        REQUIRE(scan.value().count == frames.size() * fragments_per_frame);

        for (std::size_t i = 0; i < frames.size(); ++i) {
            const auto first_fragment = scan.value().offsets[i * fragments_per_frame];
            CHECK(bot.value()[i] == first_fragment - fragments_start);
        }
    }
}

TEST_CASE("fragment_frame splits a frame into k fragments", "[encoding][encapsulation]") {
    SECTION("every k from 1 to the frame length reassembles exactly") {
        const auto frame = sequential_bytes(12, 1);
        for (std::size_t k = 1; k <= frame.size(); ++k) {
            auto fragments = fragment_frame(frame, k);
            REQUIRE(fragments.is_ok());
            REQUIRE(fragments.value().size() == k);
            for (const auto& fragment : fragments.value()) {
                CHECK(fragment.size() % 2 == 0);
            }

            std::vector<std::vector<uint8_t>> frames{frame};
            auto encapsulated = encapsulate(frames, k, false);
            REQUIRE(encapsulated.is_ok());

            frame_options options;
            options.number_of_frames = 1;
            auto reassembled = get_frame(std::span<const uint8_t>{encapsulated.value()}, 0,
                                         options);
            REQUIRE(reassembled.is_ok());
            CHECK(reassembled.value() == frame);
        }
    }

    SECTION("odd frames gain a single trailing pad byte") {
        const auto frame = sequential_bytes(9, 1);
        for (std::size_t k = 1; k <= frame.size(); ++k) {
            auto fragments = fragment_frame(frame, k);
            REQUIRE(fragments.is_ok());
            auto joined = join_fragments(fragments.value());
            REQUIRE(joined.size() == 10);
            CHECK(std::equal(frame.begin(), frame.end(), joined.begin()));
            CHECK(joined.back() == 0);
        }
    }

    SECTION("zero fragments") {
        auto fragments = fragment_frame(sequential_bytes(4), 0);
        REQUIRE(fragments.is_err());
        CHECK(fragments.error().code == dcmwire::error_codes::invalid_fragment_count);
    }

    SECTION("more fragments than bytes") {
        auto fragments = fragment_frame(sequential_bytes(4), 5);
        REQUIRE(fragments.is_err());
        CHECK(fragments.error().code == dcmwire::error_codes::invalid_fragment_count);
        CHECK_THAT(fragments.error().message, ContainsSubstring("Too many fragments"));
    }
}

TEST_CASE("itemize_fragment", "[encoding][encapsulation]") {
    std::vector<uint8_t> fragment{0xAA, 0xBB};
    CHECK(itemize_fragment(fragment) ==
          std::vector<uint8_t>{0xFE, 0xFF, 0x00, 0xE0, 0x02, 0x00, 0x00, 0x00, 0xAA, 0xBB});
}

TEST_CASE("Basic Offset Table size limit", "[encoding][encapsulation]") {
    SECTION("offsets within 32 bits") {
        std::vector<uint64_t> lengths{0xFFFFFFF0ull, 10};
        CHECK(check_basic_offset_table_limit(lengths).is_ok());
    }

    SECTION("the final offset overflows") {
        std::vector<uint64_t> lengths{0xFFFFFFFFull, 10};
        auto result = check_basic_offset_table_limit(lengths);
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmwire::error_codes::offset_table_overflow);
        CHECK_THAT(result.error().message, ContainsSubstring("Extended Offset Table"));
    }

    SECTION("the last frame's own length does not count") {
        std::vector<uint64_t> lengths{0xFFFFFFFFull};
        CHECK(check_basic_offset_table_limit(lengths).is_ok());
    }
}

// ============================================================================
// Reading
// ============================================================================

TEST_CASE("get_frame equals sequential iteration", "[encoding][encapsulation]") {
    const auto frames = sample_frames();

    SECTION("with a Basic Offset Table") {
        for (std::size_t fragments_per_frame : {1u, 3u}) {
            auto encapsulated = encapsulate(frames, fragments_per_frame, true);
            REQUIRE(encapsulated.is_ok());

            auto iterated = iterate_all(encapsulated.value(), {});
            REQUIRE(iterated.size() == frames.size());
            for (std::size_t i = 0; i < frames.size(); ++i) {
                auto frame = get_frame(std::span<const uint8_t>{encapsulated.value()}, i);
                REQUIRE(frame.is_ok());
                CHECK(frame.value() == iterated[i]);
                CHECK(frame.value() == frames[i]);
            }
        }
    }

    SECTION("one fragment per frame without a Basic Offset Table") {
        auto encapsulated = encapsulate(frames, 1, false);
        REQUIRE(encapsulated.is_ok());

        frame_options options;
        options.number_of_frames = static_cast<uint32_t>(frames.size());
        auto iterated = iterate_all(encapsulated.value(), options);
        REQUIRE(iterated.size() == frames.size());
        for (std::size_t i = 0; i < frames.size(); ++i) {
            auto frame = get_frame(std::span<const uint8_t>{encapsulated.value()}, i, options);
            REQUIRE(frame.is_ok());
            CHECK(frame.value() == iterated[i]);
            CHECK(frame.value() == frames[i]);
        }
    }

    SECTION("with an Extended Offset Table") {
        auto extended = encapsulate_extended(frames);
        REQUIRE(extended.is_ok());

        frame_options options;
        options.extended_offsets = extended.value().table;
        auto iterated = iterate_all(extended.value().encapsulated, options);
        REQUIRE(iterated.size() == frames.size());
        for (std::size_t i = 0; i < frames.size(); ++i) {
            auto frame = get_frame(std::span<const uint8_t>{extended.value().encapsulated}, i,
                                   options);
            REQUIRE(frame.is_ok());
            CHECK(frame.value() == iterated[i]);
            CHECK(frame.value() == frames[i]);
        }
    }

    SECTION("get_frame leaves the source position unchanged") {
        auto encapsulated = encapsulate(frames, 1, true);
        REQUIRE(encapsulated.is_ok());
        memory_source source{encapsulated.value()};
        source.seek(0);
        auto frame = get_frame(source, 2);
        REQUIRE(frame.is_ok());
        CHECK(source.tell() == 0);
    }
}

TEST_CASE("frame boundaries must be determinable", "[encoding][encapsulation]") {
    auto encapsulated = encapsulate(sample_frames(), 1, false);
    REQUIRE(encapsulated.is_ok());

    SECTION("iterator") {
        memory_source source{encapsulated.value()};
        auto iterator = frame_iterator::create(source);
        REQUIRE(iterator.is_err());
        CHECK(iterator.error().code == dcmwire::error_codes::frame_boundaries_indeterminate);
    }

    SECTION("random access") {
        auto frame = get_frame(std::span<const uint8_t>{encapsulated.value()}, 0);
        REQUIRE(frame.is_err());
        CHECK(frame.error().code == dcmwire::error_codes::frame_boundaries_indeterminate);
    }
}

TEST_CASE("a single frame takes every fragment", "[encoding][encapsulation]") {
    std::vector<std::vector<uint8_t>> frames{sequential_bytes(16)};
    auto encapsulated = encapsulate(frames, 4, false);
    REQUIRE(encapsulated.is_ok());

    frame_options options;
    options.number_of_frames = 1;
    auto iterated = iterate_all(encapsulated.value(), options);
    REQUIRE(iterated.size() == 1);
    CHECK(iterated.front() == frames.front());

    auto out_of_range = get_frame(std::span<const uint8_t>{encapsulated.value()}, 1, options);
    REQUIRE(out_of_range.is_err());
    CHECK(out_of_range.error().code == dcmwire::error_codes::frame_index_out_of_range);
}

TEST_CASE("frames are split on JPEG end-of-image markers", "[encoding][encapsulation]") {
    std::vector<uint8_t> stream = empty_bot();
    append(stream, itemize_fragment(std::vector<uint8_t>{0xFF, 0xD8, 0x01, 0x02}));
    append(stream, itemize_fragment(std::vector<uint8_t>{0x03, 0x04, 0xFF, 0xD9}));
    append(stream, itemize_fragment(std::vector<uint8_t>{0xFF, 0xD8, 0x05, 0xFF, 0xD9, 0x00}));

    std::vector<std::string> warnings;
    frame_options options;
    options.number_of_frames = 2;
    options.on_warning = [&](const std::string& w) { warnings.push_back(w); };

    SECTION("complete frames") {
        auto frames = iterate_all(stream, options);
        REQUIRE(frames.size() == 2);
        CHECK(frames[0] == std::vector<uint8_t>{0xFF, 0xD8, 0x01, 0x02, 0x03, 0x04, 0xFF, 0xD9});
        CHECK(frames[1] == std::vector<uint8_t>{0xFF, 0xD8, 0x05, 0xFF, 0xD9, 0x00});
        CHECK(warnings.empty());

        auto second = get_frame(std::span<const uint8_t>{stream}, 1, options);
        REQUIRE(second.is_ok());
        CHECK(second.value() == frames[1]);
    }

    SECTION("a final frame without a marker is kept with a warning") {
        append(stream, itemize_fragment(std::vector<uint8_t>{0x07, 0x08}));
        auto frames = iterate_all(stream, options);
        REQUIRE(frames.size() == 3);
        CHECK(frames[2] == std::vector<uint8_t>{0x07, 0x08});
        REQUIRE_FALSE(warnings.empty());
        CHECK_THAT(warnings.front(), ContainsSubstring("no JPEG EOI/EOC marker"));
    }

    SECTION("fewer frames than expected is a warning") {
        std::vector<uint8_t> unmarked = empty_bot();
        append(unmarked, itemize_fragment(std::vector<uint8_t>{0x01, 0x02}));
        append(unmarked, itemize_fragment(std::vector<uint8_t>{0x03, 0x04}));
        append(unmarked, itemize_fragment(std::vector<uint8_t>{0x05, 0x06}));

        auto frames = iterate_all(unmarked, options);
        REQUIRE(frames.size() == 1);
        CHECK(frames[0] == std::vector<uint8_t>{1, 2, 3, 4, 5, 6});
        REQUIRE(warnings.size() == 2);
        CHECK_THAT(warnings[0], ContainsSubstring("no JPEG EOI/EOC marker"));
        CHECK_THAT(warnings[1], ContainsSubstring("(1 vs. 2)"));
    }
}

TEST_CASE("fewer fragments than frames is an error", "[encoding][encapsulation]") {
    std::vector<std::vector<uint8_t>> frames{sequential_bytes(8)};
    auto encapsulated = encapsulate(frames, 1, false);
    REQUIRE(encapsulated.is_ok());

    memory_source source{encapsulated.value()};
    frame_options options;
    options.number_of_frames = 3;
    auto iterator = frame_iterator::create(source, options);
    REQUIRE(iterator.is_err());
    CHECK(iterator.error().code == dcmwire::error_codes::insufficient_fragments);
}

TEST_CASE("Basic Offset Table parsing errors", "[encoding][encapsulation]") {
    SECTION("first item is not an item tag") {
        std::vector<uint8_t> stream{0xFE, 0xFF, 0xDD, 0xE0, 0x00, 0x00, 0x00, 0x00};
        memory_source source{stream};
        auto bot = parse_basic_offsets(source);
        REQUIRE(bot.is_err());
        CHECK(bot.error().code == dcmwire::error_codes::invalid_offset_table);
    }

    SECTION("length is not a multiple of 4") {
        std::vector<uint8_t> stream{0xFE, 0xFF, 0x00, 0xE0, 0x03, 0x00, 0x00, 0x00, 1, 2, 3};
        memory_source source{stream};
        auto bot = parse_basic_offsets(source);
        REQUIRE(bot.is_err());
        CHECK_THAT(bot.error().message, ContainsSubstring("multiple of 4"));
    }

    SECTION("offsets out of order") {
        std::vector<uint8_t> stream{0xFE, 0xFF, 0x00, 0xE0, 0x08, 0x00, 0x00, 0x00,
                                    0x0A, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        memory_source source{stream};
        auto iterator = frame_iterator::create(source);
        REQUIRE(iterator.is_err());
        CHECK(iterator.error().code == dcmwire::error_codes::invalid_offset_table);
    }

    SECTION("offsets past the end of the pixel data") {
        // Offsets 0 and 256, but a single 4 byte fragment follows
        std::vector<uint8_t> stream{0xFE, 0xFF, 0x00, 0xE0, 0x08, 0x00, 0x00, 0x00,
                                    0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00};
        append(stream, {0xFE, 0xFF, 0x00, 0xE0, 0x04, 0x00, 0x00, 0x00, 1, 2, 3, 4});

        auto last = get_frame(std::span<const uint8_t>{stream}, 1);
        REQUIRE(last.is_err());
        CHECK(last.error().code == dcmwire::error_codes::insufficient_data);
        CHECK_THAT(last.error().message, ContainsSubstring("past the end"));

        auto first = get_frame(std::span<const uint8_t>{stream}, 0);
        REQUIRE(first.is_err());
        CHECK(first.error().code == dcmwire::error_codes::insufficient_data);
    }

    SECTION("index beyond the table") {
        auto encapsulated = encapsulate(sample_frames(), 1, true);
        REQUIRE(encapsulated.is_ok());
        auto frame = get_frame(std::span<const uint8_t>{encapsulated.value()}, 3);
        REQUIRE(frame.is_err());
        CHECK(frame.error().code == dcmwire::error_codes::frame_index_out_of_range);
    }
}

TEST_CASE("fragment_reader", "[encoding][encapsulation]") {
    SECTION("stops at the Sequence Delimitation Item") {
        std::vector<uint8_t> stream = itemize_fragment(std::vector<uint8_t>{1, 2});
        append(stream, {0xFE, 0xFF, 0xDD, 0xE0, 0x00, 0x00, 0x00, 0x00});
        append(stream, {0x99, 0x99});

        memory_source source{stream};
        fragment_reader reader{source};
        auto first = reader.next();
        REQUIRE(first.is_ok());
        REQUIRE(first.value());
        CHECK(*first.value() == std::vector<uint8_t>{1, 2});
        auto end = reader.next();
        REQUIRE(end.is_ok());
        CHECK_FALSE(end.value());
        CHECK(source.tell() == 18);
    }

    SECTION("non-zero delimiter length is a warning") {
        std::vector<uint8_t> stream{0xFE, 0xFF, 0xDD, 0xE0, 0x01, 0x00, 0x00, 0x00};
        std::vector<std::string> warnings;
        memory_source source{stream};
        fragment_reader reader{source, byte_order::little_endian,
                               [&](const std::string& w) { warnings.push_back(w); }};
        auto end = reader.next();
        REQUIRE(end.is_ok());
        CHECK_FALSE(end.value());
        REQUIRE(warnings.size() == 1);
        CHECK_THAT(warnings.front(), ContainsSubstring("0x00000001"));
    }

    SECTION("unexpected tag") {
        std::vector<uint8_t> stream{0xE0, 0x7F, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00};
        memory_source source{stream};
        fragment_reader reader{source};
        auto next = reader.next();
        REQUIRE(next.is_err());
        CHECK(next.error().code == dcmwire::error_codes::invalid_fragment);
        CHECK_THAT(next.error().message, ContainsSubstring("(7FE0,0010)"));
    }

    SECTION("undefined item length") {
        std::vector<uint8_t> stream{0xFE, 0xFF, 0x00, 0xE0, 0xFF, 0xFF, 0xFF, 0xFF};
        memory_source source{stream};
        fragment_reader reader{source};
        auto next = reader.next();
        REQUIRE(next.is_err());
        CHECK_THAT(next.error().message, ContainsSubstring("Undefined item length"));
    }
}

TEST_CASE("extended_offset_table byte conversion", "[encoding][encapsulation]") {
    extended_offset_table table;
    table.offsets = {0, 18, 300};
    table.lengths = {10, 274, 6};

    auto parsed = extended_offset_table::from_bytes(table.offsets_bytes(), table.lengths_bytes());
    REQUIRE(parsed.is_ok());
    CHECK(parsed.value().offsets == table.offsets);
    CHECK(parsed.value().lengths == table.lengths);

    SECTION("mismatched counts") {
        auto offsets = table.offsets_bytes();
        auto lengths = table.lengths_bytes();
        lengths.resize(16);
        auto result = extended_offset_table::from_bytes(offsets, lengths);
        REQUIRE(result.is_err());
        CHECK(result.error().code == dcmwire::error_codes::invalid_offset_table);
    }

    SECTION("length not a multiple of 8") {
        std::vector<uint8_t> odd(12, 0);
        auto result = extended_offset_table::from_bytes(odd, odd);
        REQUIRE(result.is_err());
        CHECK_THAT(result.error().message, ContainsSubstring("multiple of 8"));
    }
}

TEST_CASE("encapsulate_extended table entries", "[encoding][encapsulation]") {
    std::vector<std::vector<uint8_t>> frames{sequential_bytes(4), sequential_bytes(5)};
    auto extended = encapsulate_extended(frames);
    REQUIRE(extended.is_ok());

    const auto& table = extended.value().table;
    CHECK(table.offsets == std::vector<uint64_t>{0, 12});
    CHECK(table.lengths == std::vector<uint64_t>{4, 6});

    // Empty Basic Offset Table
    const auto& bytes = extended.value().encapsulated;
    CHECK(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 8) == empty_bot());
}
