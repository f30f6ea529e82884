#pragma once

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <variant>
#include <arpa/inet.h>
#include "meta/helpers.hpp"
#include "mybsock/buffers.hpp"
#include "mytftp/types.hpp"

namespace WindTftp::MyTftp {
    struct RWOpt {};
    struct DataOpt {};
    struct AckOpt {};
    struct OackOpt {};
    struct ErrOpt {};

    inline constexpr auto opcode_size = 2UL;
    inline constexpr auto dud_payload_num = std::numeric_limits<std::size_t>::max();

    inline const std::string mode_name_netascii = "netascii";
    inline const std::string mode_name_mail = "mail";
    inline const std::string mode_name_octet = "octet";

    [[nodiscard]] inline const std::string& toFileModeName(DataMode mode) noexcept {
        if (mode == DataMode::netascii) {
            return mode_name_netascii;
        } else if (mode == DataMode::mail) {
            return mode_name_mail;
        } else {
            return mode_name_octet;
        }
    }

    [[nodiscard]] inline std::string toLowerAscii(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        return text;
    }

    template <typename DataType>
    struct HelperResult {
        DataType data;
        std::size_t current_pos;
    };

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<tftp_u16> readU16(const MyBSock::FixedBuffer<T, N>& source, std::size_t begin) {
        tftp_u16 temp = 0;

        if (begin + 2UL > source.getLength()) {
            return {0, dud_payload_num};
        }

        std::memcpy(&temp, source.viewPtr() + begin, 2UL);

        return {ntohs(temp), begin + 2UL};
    }

    /// @note Fails unless a NUL delimiter ends the text inside the datagram.
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<std::string> readText(const MyBSock::FixedBuffer<T, N>& source, std::size_t begin) {
        std::string temp;
        const auto source_len = source.getLength();

        if (begin >= source_len) {
            return {temp, dud_payload_num};
        }

        const auto* read_ptr = source.viewPtr();
        auto read_offset = begin;

        for (; read_offset < source_len; read_offset++) {
            const auto c = static_cast<char>(read_ptr[read_offset]);

            if (c == '\0') {
                break;
            }

            temp += c;
        }

        if (read_offset == source_len) {
            return {std::string {}, dud_payload_num};
        }

        /// NOTE: +1 to skip the delimiter before the next field.
        return {
            std::move(temp),
            read_offset + 1UL
        };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<Chunk> readBlob(const MyBSock::FixedBuffer<T, N>& source, std::size_t begin) {
        const auto source_len = source.getLength();

        if (begin > source_len) {
            return {Chunk {}, dud_payload_num};
        }

        const auto* read_ptr = source.viewPtr();

        return {
            Chunk(read_ptr + begin, read_ptr + source_len),
            source_len
        };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<OptionList> readOptions(const MyBSock::FixedBuffer<T, N>& source, std::size_t begin) {
        OptionList temp;
        auto read_offset = begin;

        while (read_offset < source.getLength()) {
            auto [name, pos_1] = readText(source, read_offset);

            if (pos_1 == dud_payload_num or name.empty()) {
                return {OptionList {}, dud_payload_num};
            }

            auto [value, pos_2] = readText(source, pos_1);

            if (pos_2 == dud_payload_num) {
                return {OptionList {}, dud_payload_num};
            }

            temp.push_back({toLowerAscii(std::move(name)), std::move(value)});
            read_offset = pos_2;
        }

        return {std::move(temp), read_offset};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeU16(MyBSock::FixedBuffer<T, N>& target, std::size_t begin, tftp_u16 value) {
        const auto network_ord_value = htons(value);

        if (begin + 2UL > target.getSize()) {
            return { false, dud_payload_num };
        }

        std::memcpy(target.viewPtr() + begin, &network_ord_value, 2UL);

        return { true, begin + 2UL };
    }

    /// @note Writes the text plus its NUL delimiter.
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeText(MyBSock::FixedBuffer<T, N>& target, std::size_t begin, const std::string& value) {
        const auto value_len = value.size();

        if (begin + value_len + 1UL > target.getSize()) {
            return { false, dud_payload_num };
        }

        auto* write_ptr = target.viewPtr() + begin;
        std::memcpy(write_ptr, value.data(), value_len);
        write_ptr[value_len] = T {};

        return { true, begin + value_len + 1UL };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeBlob(MyBSock::FixedBuffer<T, N>& target, std::size_t begin, const Chunk& value) {
        const auto value_len = value.size();

        if (begin + value_len > target.getSize()) {
            return { false, dud_payload_num };
        }

        if (value_len > 0) {
            std::memcpy(target.viewPtr() + begin, value.data(), value_len);
        }

        return { true, begin + value_len };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeOptions(MyBSock::FixedBuffer<T, N>& target, std::size_t begin, const OptionList& options) {
        auto write_pos = begin;

        for (const auto& [name, value] : options) {
            auto [name_ok, pos_1] = writeText(target, write_pos, name);

            if (not name_ok) {
                return { false, dud_payload_num };
            }

            auto [value_ok, pos_2] = writeText(target, pos_1, value);

            if (not value_ok) {
                return { false, dud_payload_num };
            }

            write_pos = pos_2;
        }

        return { true, write_pos };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<RWPayload> parsePayload(const MyBSock::FixedBuffer<T, N>& source, [[maybe_unused]] RWOpt opt) {
        auto [filename, pos_1] = readText(source, opcode_size);

        if (pos_1 == dud_payload_num or filename.empty()) {
            return { {}, dud_payload_num };
        }

        auto [filemode, pos_2] = readText(source, pos_1);

        if (pos_2 == dud_payload_num) {
            return { {}, dud_payload_num };
        }

        auto [options, pos_3] = readOptions(source, pos_2);

        if (pos_3 == dud_payload_num) {
            return { {}, dud_payload_num };
        }

        const auto lowered_mode = toLowerAscii(std::move(filemode));
        DataMode temp_mode;

        if (lowered_mode == mode_name_netascii) {
            temp_mode = DataMode::netascii;
        } else if (lowered_mode == mode_name_mail) {
            temp_mode = DataMode::mail;
        } else if (lowered_mode == mode_name_octet) {
            temp_mode = DataMode::octet;
        } else {
            temp_mode = DataMode::dud;
        }

        return {
            RWPayload {std::move(filename), temp_mode, std::move(options)},
            pos_3
        };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<DataPayload> parsePayload(const MyBSock::FixedBuffer<T, N>& source, [[maybe_unused]] DataOpt opt) {
        auto [block_n, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_payload_num) {
            return { {}, dud_payload_num };
        }

        auto [data_blob, pos_2] = readBlob(source, pos_1);

        return { DataPayload {block_n, std::move(data_blob)}, pos_2 };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<AckPayload> parsePayload(const MyBSock::FixedBuffer<T, N>& source, [[maybe_unused]] AckOpt opt) {
        auto [block_n, pos_1] = readU16(source, opcode_size);

        return { AckPayload {block_n}, pos_1 };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<OackPayload> parsePayload(const MyBSock::FixedBuffer<T, N>& source, [[maybe_unused]] OackOpt opt) {
        auto [options, pos_1] = readOptions(source, opcode_size);

        return { OackPayload {std::move(options)}, pos_1 };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<ErrorPayload> parsePayload(const MyBSock::FixedBuffer<T, N>& source, [[maybe_unused]] ErrOpt opt) {
        auto [raw_errcode, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_payload_num) {
            return { {}, dud_payload_num };
        }

        auto [raw_msg, pos_2] = readText(source, pos_1);

        if (pos_2 == dud_payload_num) {
            return { {}, dud_payload_num };
        }

        const auto errcode = (raw_errcode <= static_cast<tftp_u16>(ErrorCode::last))
            ? static_cast<ErrorCode>(raw_errcode)
            : ErrorCode::not_defined;

        return {
            ErrorPayload {errcode, std::move(raw_msg)},
            pos_2
        };
    }

    /// @note Yields `Opcode::none` for any datagram that does not decode cleanly.
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] Message parseMessage(const MyBSock::FixedBuffer<T, N>& source) {
        const auto [opcode, pos] = readU16(source, 0UL);

        if (pos == dud_payload_num) {
            return { Opcode::none, DudPayload {} };
        }

        auto pack = [](const auto& opcode_v, auto&& result) -> Message {
            if (result.current_pos == dud_payload_num) {
                return { Opcode::none, DudPayload {} };
            }

            return { opcode_v, std::move(result.data) };
        };

        const auto opcode_enum_v = static_cast<Opcode>(opcode);

        switch (opcode_enum_v) {
            case Opcode::rrq:
            case Opcode::wrq:
                return pack(opcode_enum_v, parsePayload(source, RWOpt {}));
            case Opcode::data:
                return pack(opcode_enum_v, parsePayload(source, DataOpt {}));
            case Opcode::ack:
                return pack(opcode_enum_v, parsePayload(source, AckOpt {}));
            case Opcode::oack:
                return pack(opcode_enum_v, parsePayload(source, OackOpt {}));
            case Opcode::err:
                return pack(opcode_enum_v, parsePayload(source, ErrOpt {}));
            default:
                return { Opcode::none, DudPayload {} };
        }
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> serializePayload(MyBSock::FixedBuffer<T, N>& target, const RWPayload& payload) {
        const auto& [filename, filemode, options] = payload;

        auto [field_1_ok, pos_1] = writeText(target, opcode_size, filename);

        if (not field_1_ok) {
            return { false, dud_payload_num };
        }

        auto [field_2_ok, pos_2] = writeText(target, pos_1, toFileModeName(filemode));

        if (not field_2_ok) {
            return { false, dud_payload_num };
        }

        return writeOptions(target, pos_2, options);
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> serializePayload(MyBSock::FixedBuffer<T, N>& target, const DataPayload& payload) {
        auto [field_1_ok, pos_1] = writeU16(target, opcode_size, payload.block_n);

        if (not field_1_ok) {
            return { false, dud_payload_num };
        }

        return writeBlob(target, pos_1, payload.data);
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> serializePayload(MyBSock::FixedBuffer<T, N>& target, const AckPayload& payload) {
        return writeU16(target, opcode_size, payload.block_n);
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> serializePayload(MyBSock::FixedBuffer<T, N>& target, const OackPayload& payload) {
        return writeOptions(target, opcode_size, payload.options);
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> serializePayload(MyBSock::FixedBuffer<T, N>& target, const ErrorPayload& payload) {
        auto [field_1_ok, pos_1] = writeU16(target, opcode_size, static_cast<tftp_u16>(payload.error));

        if (not field_1_ok) {
            return { false, dud_payload_num };
        }

        return writeText(target, pos_1, payload.message);
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> serializePayload([[maybe_unused]] MyBSock::FixedBuffer<T, N>& target, [[maybe_unused]] const DudPayload& payload) {
        return { false, dud_payload_num };
    }

    /// @note Leaves `target` empty when the message does not fit or has no payload.
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] bool serializeMessage(MyBSock::FixedBuffer<T, N>& target, const Message& msg) {
        target.reset();

        const auto opcode_n = static_cast<tftp_u16>(msg.op);

        auto [field_0_ok, pos_0] = writeU16(target, 0UL, opcode_n);

        if (not field_0_ok) {
            return false;
        }

        const auto [body_ok, body_end] = std::visit([&target](const auto& payload) {
            return serializePayload(target, payload);
        }, msg.payload);

        if (not body_ok) {
            return false;
        }

        target.markLength(body_end);

        return true;
    }
}
