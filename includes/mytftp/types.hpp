#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace WindTftp::MyTftp {
    using tftp_u8 = unsigned char;
    using tftp_u16 = std::uint16_t;

    /// NOTE: one DATA payload, at most one negotiated block size long.
    using Chunk = std::vector<tftp_u8>;

    enum class Opcode : tftp_u16 {
        rrq = 1,
        wrq,
        data,
        ack,
        err,
        oack,
        none,
        last = none
    };

    enum class DataMode : unsigned char {
        netascii,
        octet,
        mail,
        dud,
        last = dud
    };

    enum class ErrorCode : tftp_u16 {
        not_defined,
        file_not_found,
        access_violation,
        storage_issue,
        bad_operation,
        unknown_tid,
        file_already_exists,
        no_user,
        bad_options,
        last = bad_options
    };

    [[nodiscard]] std::string_view toErrorMsg(ErrorCode errcode) noexcept;
    [[nodiscard]] std::string_view toOpcodeName(Opcode op) noexcept;

    struct OptionEntry {
        std::string name;
        std::string value;
    };

    /// NOTE: keeps the order in which the options went over the wire.
    using OptionList = std::vector<OptionEntry>;

    struct DudPayload {};

    struct RWPayload {
        std::string filename;
        DataMode mode;
        OptionList options;
    };

    struct DataPayload {
        tftp_u16 block_n;
        Chunk data;
    };

    struct AckPayload {
        tftp_u16 block_n;
    };

    struct OackPayload {
        OptionList options;
    };

    struct ErrorPayload {
        ErrorCode error;
        std::string message;
    };

    struct Message {
        Opcode op;
        std::variant<DudPayload, RWPayload, DataPayload, AckPayload, OackPayload, ErrorPayload> payload;
    };

    [[nodiscard]] inline Message makeAck(tftp_u16 block_n) {
        return { Opcode::ack, AckPayload {block_n} };
    }

    [[nodiscard]] inline Message makeError(ErrorCode errcode, std::string message) {
        return { Opcode::err, ErrorPayload {errcode, std::move(message)} };
    }
}
