/**
 * @page cf-constants cecflow Bus Constants
 * @file cec_constants.hpp
 * @brief Logical addresses, opcodes, power states and result codes shared by every layer.
 *
 * @details
 * PURPOSE
 * -------
 * One place for the numbers that travel on the bus or back to callers. The
 * message model, the builders, the actions and the CLI all include this file
 * and nothing else for protocol constants.
 *
 * WHAT LIVES HERE
 * ---------------
 * - Logical addresses (4-bit, 0..15). 15 is broadcast when used as a
 *   destination and "unregistered" when used as a source.
 * - The subset of opcodes the engine speaks. The full CEC opcode table is
 *   deliberately not mirrored.
 * - Power status values carried by `<Report Power Status>`.
 * - Transport results (what the link layer reports for one send).
 * - Control results (what an action hands to every attached caller).
 *
 * RESULT CONVENTION
 * -----------------
 * Transport results are zero or negative. Control results are the *negated*
 * transport result on a link failure, so a NACK (-1) reaches the caller as 1.
 * A response timeout has its own code (RESULT_TIMEOUT) that never collides with
 * a negated transport code.
 *
 * @code
 *   TransportResult r = TransportResult::Nack;   // -1 from the bus
 *   int result = negate(r);                      // 1 handed to callers
 * @endcode
 */
#pragma once
#include <stdint.h>

namespace cecflow {

// ========================== Logical addresses ==========================
enum : uint8_t {
    ADDR_TV             = 0x0,  /**< Display / TV. */
    ADDR_RECORDER_1     = 0x1,
    ADDR_RECORDER_2     = 0x2,
    ADDR_TUNER_1        = 0x3,
    ADDR_PLAYBACK_1     = 0x4,  /**< Default identity of this device. */
    ADDR_AUDIO_SYSTEM   = 0x5,
    ADDR_TUNER_2        = 0x6,
    ADDR_TUNER_3        = 0x7,
    ADDR_PLAYBACK_2     = 0x8,
    ADDR_RECORDER_3     = 0x9,
    ADDR_TUNER_4        = 0xA,
    ADDR_PLAYBACK_3     = 0xB,
    ADDR_BACKUP_1       = 0xC,
    ADDR_BACKUP_2       = 0xD,
    ADDR_SPECIFIC_USE   = 0xE,
    ADDR_BROADCAST      = 0xF,  /**< Destination: everyone. Source: unregistered. */
    ADDR_UNREGISTERED   = 0xF,

    ADDR_MAX            = 0xF   /**< Highest encodable 4-bit address. */
};

/// Physical address used when none is known ("f.f.f.f").
static constexpr uint16_t INVALID_PHYSICAL_ADDRESS = 0xFFFF;

/// Port id written to the routing records after this device claims active source.
static constexpr int CEC_SWITCH_HOME = 0;

// ============================== Opcodes ================================
/**
 * @name Opcodes
 * @brief The opcodes the engine builds or understands.
 *
 * Parameter schema (bytes after the opcode):
 *   IMAGE_VIEW_ON, TEXT_VIEW_ON, STANDBY, GIVE_DEVICE_POWER_STATUS : 0
 *   ACTIVE_SOURCE                                                  : 2 (physical address, big endian)
 *   REPORT_POWER_STATUS                                            : 1 (power status)
 *   FEATURE_ABORT                                                  : 2 (opcode, reason)
 */
enum : uint8_t {
    OP_FEATURE_ABORT            = 0x00,
    OP_IMAGE_VIEW_ON            = 0x04,
    OP_TEXT_VIEW_ON             = 0x0D,
    OP_STANDBY                  = 0x36,
    OP_ACTIVE_SOURCE            = 0x82,
    OP_GIVE_DEVICE_POWER_STATUS = 0x8F,
    OP_REPORT_POWER_STATUS      = 0x90
};

// ============================ Power status =============================
enum : int {
    POWER_STATUS_UNKNOWN              = -1, /**< No answer (never on the wire). */
    POWER_STATUS_ON                   = 0,
    POWER_STATUS_STANDBY              = 1,
    POWER_STATUS_TRANSIENT_TO_ON      = 2,
    POWER_STATUS_TRANSIENT_TO_STANDBY = 3
};

// ========================== Transport results ==========================
/**
 * @brief Outcome of one send as reported by the link layer.
 *
 * Success is zero; every failure is negative so that `negate()` turns it into
 * a positive control result.
 */
enum class TransportResult : int8_t {
    Success = 0,
    Nack    = -1,  /**< Destination did not acknowledge. */
    Busy    = -2,  /**< Line busy / arbitration lost after retries. */
    Fail    = -3   /**< Any other link or driver failure. */
};

/// Control result for a failed send: the negated transport code (NACK -1 -> 1).
inline int negate(TransportResult r) { return -static_cast<int>(r); }

// =========================== Control results ===========================
/**
 * @name Control results
 * @brief Values delivered through `ControlCallback::on_complete()`.
 *
 * RESULT_NACK..RESULT_FAIL are the negated transport results. RESULT_NO_ACK is
 * what standby reports when its bounded wait runs out; it is the negated NACK.
 */
enum : int {
    RESULT_SUCCESS   = 0,
    RESULT_NACK      = 1,
    RESULT_BUSY      = 2,
    RESULT_FAIL      = 3,
    RESULT_TIMEOUT   = 4,  /**< Target never answered within the retry budget. */
    RESULT_CANCELLED = 5,  /**< Action was cleared before it could complete. */

    RESULT_NO_ACK    = RESULT_NACK
};

/// Default per-wait response timeout in milliseconds.
static constexpr uint32_t RESPONSE_TIMEOUT_MS_DEFAULT = 2000;

/// Default number of `<Give Device Power Status>` queries one touch play sends before giving up.
static constexpr uint8_t POWER_STATUS_LOOP_MAX_DEFAULT = 10;

} // namespace cecflow
