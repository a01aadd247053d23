/**
 * @page cf-builders cecflow Message Builders
 * @file message_builder.hpp
 * @brief Factory functions for the well-known message shapes, plus text helpers.
 *
 * @details
 * PURPOSE
 * -------
 * Actions never assemble headers or parameter bytes by hand. They call one of
 * the builders below, which know the opcode and the parameter layout, and get
 * back a validated `CecMessage`.
 *
 * BUILDERS
 * --------
 *   build_text_view_on(src, dst)             [dst] <Text View On>
 *   build_image_view_on(src, dst)            [dst] <Image View On>
 *   build_active_source(src, phys)           [broadcast] <Active Source> phys(hi, lo)
 *   build_give_device_power_status(src, dst) [dst] <Give Device Power Status>
 *   build_report_power_status(src, dst, st)  [dst] <Report Power Status> st
 *   build_standby(src, dst)                  [dst] <Standby>
 *
 * TEXT HELPERS
 * ------------
 * - `opcode_name()` maps an opcode to a short snake_case label for logs.
 * - `describe()` renders one message as `src=4 dst=0 op=text_view_on params=`.
 * - `parse_hex_frame()` reads cec-ctl style hex ("40:04", "4f 82 10 00").
 *
 * MAINTENANCE
 * -----------
 * Keep builders explicit and small. When a new opcode is needed, add its
 * constant and schema to cec_constants.hpp / CecMessage::expected_params first.
 */
#pragma once
#include <string>
#include <stdint.h>
#include "cec_message.hpp"

namespace cecflow {

// ============================ Builders ============================

/// `<Text View On>`: wake the display and select this input.
CecMessage build_text_view_on(uint8_t src, uint8_t dst);

/// `<Image View On>`: like Text View On, without closing on-screen menus.
CecMessage build_image_view_on(uint8_t src, uint8_t dst);

/**
 * @brief `<Active Source>` broadcast announcing the sender's physical address.
 * @param src            Sender logical address.
 * @param physical_addr  Sender physical address (e.g. 0x1000 for 1.0.0.0).
 */
CecMessage build_active_source(uint8_t src, uint16_t physical_addr);

/// `<Give Device Power Status>`: ask `dst` for a `<Report Power Status>`.
CecMessage build_give_device_power_status(uint8_t src, uint8_t dst);

/// `<Report Power Status>` carrying one power status byte.
CecMessage build_report_power_status(uint8_t src, uint8_t dst, uint8_t power_status);

/// `<Standby>`: ask `dst` (or everyone, with ADDR_BROADCAST) to go to standby.
CecMessage build_standby(uint8_t src, uint8_t dst);

// ========================== Text helpers ==========================

/// Short label for an opcode, or "0xNN" when unknown.
std::string opcode_name(uint8_t opcode);

/// One-line, grep-friendly rendering of a message.
std::string describe(const CecMessage& msg);

/**
 * @brief Parse a hex frame such as "40:04" or "4f 82 10 00".
 *
 * Separators may be ':' ' ' or '-'. Each byte is one or two hex digits.
 *
 * @param text  Input text.
 * @param out   Parsed message on success.
 * @param err   Stable error string on failure: "empty", "bad_hex", or
 *              "invalid_message".
 * @return true when `out` holds a valid message.
 */
bool parse_hex_frame(const std::string& text, CecMessage& out, std::string& err);

} // namespace cecflow
