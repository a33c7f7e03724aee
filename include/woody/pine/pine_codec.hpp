#pragma once

/// @file pine_codec.hpp
/// @brief Table-driven encoder/decoder for PINE frames
///
/// One encoder and one decoder serve all sixteen operations. Field widths
/// and accepted answer lengths come from operation_table; the variant
/// alternative only decides which fields are present.

#include "messages.hpp"
#include "opcodes.hpp"
#include "pine_buffer.hpp"
#include "pine_error.hpp"

#include <woody/log/hex_dump.hpp>
#include <woody/log/macros.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace woody::pine {

namespace detail {

template<typename T>
concept has_address = requires(const T& t) { t.address; };

template<typename T>
concept has_data = requires(const T& t) { t.data; };

template<typename T>
concept has_slot = requires(const T& t) { t.slot; };

template<typename Request>
void encode_fields(buffer_writer& writer, const Request& request) {
    if constexpr (has_address<Request>) {
        writer.write_le<uint32_t>(request.address);
    }
    if constexpr (has_data<Request>) {
        writer.write_le(request.data);
    }
    if constexpr (has_slot<Request>) {
        writer.write_byte(request.slot);
    }
}

inline pine_error malformed(const operation_layout& layout,
                            std::span<const uint8_t> bytes,
                            std::string message) {
    pine_error err(pine_errc::malformed_frame,
                   fmt::format("{} answer: {} (accepted lengths {})",
                               layout.name, message, layout.accepted_lengths_string()));
    err.frame.assign(bytes.begin(), bytes.end());
    err.expected_lengths = layout.exact_answer_lengths();
    err.min_length = layout.min_answer_length();
    return err;
}

/// Decode the payload after the length prefix; the view is bounded to the
/// declared frame length, which has already been validated.
template<typename Answer>
Answer decode_payload(buffer_view& in, uint32_t length) {
    Answer answer;
    answer.result_code = in.read_le<uint8_t>();

    if constexpr (std::is_same_v<Answer, status_answer>) {
        if (length == frame_header_size + sizeof(uint32_t)) {
            answer.status = in.read_le<uint32_t>();
        }
    } else if constexpr (requires { typename Answer::value_type; }) {
        if (length == frame_header_size + sizeof(typename Answer::value_type)) {
            answer.memory_value = in.read_le<typename Answer::value_type>();
        }
    } else if constexpr (requires(Answer& a) { a.text; }) {
        auto text_length = in.read_le<uint32_t>();
        if (text_length > in.remaining()) {
            throw frame_error(fmt::format("string length {} exceeds frame ({} bytes left)",
                                          text_length, in.remaining()));
        }
        std::string_view text = in.read_chars(text_length);
        if (!text.empty() && text.back() == '\0') {
            text.remove_suffix(1);
        }
        answer.text.assign(text);
    }
    return answer;
}

template<size_t I>
pine_answer decode_alternative(buffer_view& in, uint32_t length) {
    return decode_payload<std::variant_alternative_t<I, pine_answer>>(in, length);
}

using decoder_fn = pine_answer (*)(buffer_view&, uint32_t);

template<size_t... I>
constexpr std::array<decoder_fn, sizeof...(I)> make_decoders(std::index_sequence<I...>) {
    return {&decode_alternative<I>...};
}

/// Decoders indexed by opcode (pine_answer alternatives are ordered by opcode)
inline constexpr auto decoders = make_decoders(std::make_index_sequence<opcode_count>{});

} // namespace detail

/// Encode a request into a length-prefixed frame
inline pine_result<std::vector<uint8_t>> encode(const pine_request& request) {
    const auto& layout = layout_of(opcode_of(request));

    buffer_writer writer(layout.request_length());
    size_t length_offset = writer.reserve_space(length_field_size);
    writer.write_byte(static_cast<uint8_t>(layout.code));
    std::visit([&](const auto& r) { detail::encode_fields(writer, r); }, request);

    if (writer.size() != layout.request_length()) {
        return make_error(pine_errc::internal,
                          fmt::format("{} request encoded to {} bytes, expected {}",
                                      layout.name, writer.size(), layout.request_length()));
    }
    writer.write_le_at<uint32_t>(length_offset, static_cast<uint32_t>(writer.size()));

    WOODY_LOG_DEBUG("encoded {} request: {}", layout.name, log::hex_string(writer.span()));
    return writer.release();
}

/// Decode an answer frame for the given operation
///
/// Validates the declared length against the operation's accepted set and
/// against the number of bytes received. Bytes past the declared length are
/// ignored.
inline pine_result<pine_answer> decode(opcode op, std::span<const uint8_t> bytes) {
    const auto& layout = layout_of(op);

    if (bytes.size() < length_field_size) {
        return std::unexpected(detail::malformed(
            layout, bytes, fmt::format("{} bytes received, length prefix needs {}",
                                       bytes.size(), length_field_size)));
    }

    uint32_t length = load_le<uint32_t>(bytes.data());
    if (!layout.accepts_answer_length(length)) {
        WOODY_LOG_DEBUG("rejected {} answer of length {}:\n{}",
                        layout.name, length, log::hex_dump(bytes));
        return std::unexpected(detail::malformed(
            layout, bytes, fmt::format("declared length {} not accepted", length)));
    }
    if (length > bytes.size()) {
        return std::unexpected(detail::malformed(
            layout, bytes, fmt::format("declared length {} but only {} bytes received",
                                       length, bytes.size())));
    }
    if (length < bytes.size()) {
        WOODY_LOG_DEBUG("{} answer: ignoring {} bytes past declared length {}",
                        layout.name, bytes.size() - length, length);
    }

    WOODY_LOG_DEBUG("{} answer bytes:\n{}", layout.name, log::hex_dump(bytes.first(length)));

    buffer_view in(bytes.first(length));
    try {
        in.skip(length_field_size);
        return detail::decoders[static_cast<size_t>(op)](in, length);
    } catch (const frame_error& e) {
        return std::unexpected(detail::malformed(layout, bytes, e.what()));
    }
}

/// Decode an answer frame directly into the answer type of a request
template<request_type Request>
pine_result<typename Request::answer_type> decode_as(std::span<const uint8_t> bytes) {
    auto answer = decode(Request::code, bytes);
    if (!answer) {
        return std::unexpected(std::move(answer.error()));
    }
    return std::get<typename Request::answer_type>(std::move(*answer));
}

} // namespace woody::pine
