#include <array>
#include "mytftp/types.hpp"

namespace WindTftp::MyTftp {
    static constexpr std::array<std::string_view, static_cast<std::size_t>(ErrorCode::last) + 1> errcode_msgs = {
        "Not defined",
        "File not found",
        "Access violation",
        "Disk full or allocation exceeded",
        "Illegal TFTP operation",
        "Unknown transfer ID",
        "File already exists",
        "No such user",
        "Option negotiation refused"
    };

    static constexpr std::array<std::string_view, static_cast<std::size_t>(Opcode::last) + 1> opcode_names = {
        "?",
        "RRQ",
        "WRQ",
        "DATA",
        "ACK",
        "ERROR",
        "OACK",
        "NONE"
    };

    std::string_view toErrorMsg(ErrorCode errcode) noexcept {
        const auto errcode_n = static_cast<std::size_t>(errcode);

        return (errcode_n < errcode_msgs.size()) ? errcode_msgs[errcode_n] : errcode_msgs[0];
    }

    std::string_view toOpcodeName(Opcode op) noexcept {
        const auto op_n = static_cast<std::size_t>(op);

        return (op_n < opcode_names.size()) ? opcode_names[op_n] : opcode_names[0];
    }
}
