#pragma once

/**
 * @file options.hpp
 * @brief Option families of the screen reader's settings
 *
 * Use storage_value(Family::MEMBER) to write or compare with the settings
 * store, and display_label(Family::MEMBER) for the translated string shown
 * in the settings dialogs.
 */

#include <array>
#include <cstdint>
#include <string_view>

#include "confflags/enum_traits.hpp"
#include "confflags/remote.hpp"
#include "confflags/storage_value.hpp"

namespace confflags {

// ─────────────────────────────────────────────────────────────────────────────
// Keyboard
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Keys usable as the screen reader modifier
 *
 * The setting stores any bitwise combination of these keys.
 */
enum class NVDAKey : uint8_t {
    CAPS_LOCK = 1,
    NUMPAD_INSERT = 2,
    EXTENDED_INSERT = 4,
};

template <>
struct FamilyTraits<NVDAKey> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "NVDAKey";
    static constexpr StorageKind kKind = StorageKind::kIntegerFlags;
    static constexpr bool kContinuous = false;
    // Labels are shared with the key name table
    static constexpr std::array<MemberDef<NVDAKey, storage_type>, 3> kMembers{{
        {NVDAKey::CAPS_LOCK, "CAPS_LOCK", 1, {"caps lock", "keyLabel"}},
        {NVDAKey::NUMPAD_INSERT, "NUMPAD_INSERT", 2, {"numpad insert", "keyLabel"}},
        {NVDAKey::EXTENDED_INSERT, "EXTENDED_INSERT", 4, {"insert", "keyLabel"}},
    }};
};

CONFFLAGS_FLAG_OPERATORS(NVDAKey);
CONFFLAGS_VERIFY_FAMILY(NVDAKey);

/**
 * @brief Typing echo for characters and words
 */
enum class TypingEcho : uint8_t {
    OFF = 0,
    EDIT_CONTROLS = 1,
    ALWAYS = 2,
};

template <>
struct FamilyTraits<TypingEcho> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "TypingEcho";
    static constexpr StorageKind kKind = StorageKind::kInteger;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<TypingEcho, storage_type>, 3> kMembers{{
        {TypingEcho::OFF, "OFF", 0, {"Off"}},
        {TypingEcho::EDIT_CONTROLS, "EDIT_CONTROLS", 1, {"Only in edit controls"}},
        {TypingEcho::ALWAYS, "ALWAYS", 2, {"Always"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(TypingEcho);

// ─────────────────────────────────────────────────────────────────────────────
// Braille
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief How braille messages are shown
 */
enum class ShowMessages : uint8_t {
    DISABLED = 0,
    USE_TIMEOUT = 1,
    SHOW_INDEFINITELY = 2,
};

template <>
struct FamilyTraits<ShowMessages> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "ShowMessages";
    static constexpr StorageKind kKind = StorageKind::kInteger;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<ShowMessages, storage_type>, 3> kMembers{{
        {ShowMessages::DISABLED, "DISABLED", 0, {"Disabled"}},
        {ShowMessages::USE_TIMEOUT, "USE_TIMEOUT", 1, {"Use timeout"}},
        {ShowMessages::SHOW_INDEFINITELY, "SHOW_INDEFINITELY", 2, {"Show indefinitely"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(ShowMessages);

/**
 * @brief What the braille display follows
 */
enum class TetherTo : uint8_t {
    AUTO,
    FOCUS,
    REVIEW,
};

template <>
struct FamilyTraits<TetherTo> {
    using storage_type = std::string_view;
    static constexpr std::string_view kName = "TetherTo";
    static constexpr StorageKind kKind = StorageKind::kString;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<TetherTo, storage_type>, 3> kMembers{{
        {TetherTo::AUTO, "AUTO", "auto", {"automatically"}},
        {TetherTo::FOCUS, "FOCUS", "focus", {"to focus"}},
        {TetherTo::REVIEW, "REVIEW", "review", {"to review"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(TetherTo);

enum class BrailleMode : uint8_t {
    FOLLOW_CURSORS,
    SPEECH_OUTPUT,
};

template <>
struct FamilyTraits<BrailleMode> {
    using storage_type = std::string_view;
    static constexpr std::string_view kName = "BrailleMode";
    static constexpr StorageKind kKind = StorageKind::kString;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<BrailleMode, storage_type>, 2> kMembers{{
        {BrailleMode::FOLLOW_CURSORS, "FOLLOW_CURSORS", "followCursors", {"follow cursors"}},
        {BrailleMode::SPEECH_OUTPUT, "SPEECH_OUTPUT", "speechOutput", {"display speech output"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(BrailleMode);

/**
 * @brief Marker shown in braille at the start of a paragraph
 */
enum class ParagraphStartMarker : uint8_t {
    NONE,
    SPACE,
    PILCROW,
};

template <>
struct FamilyTraits<ParagraphStartMarker> {
    using storage_type = std::string_view;
    static constexpr std::string_view kName = "ParagraphStartMarker";
    static constexpr StorageKind kKind = StorageKind::kString;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<ParagraphStartMarker, storage_type>, 3> kMembers{{
        {ParagraphStartMarker::NONE, "NONE", "",
         {"No paragraph start marker (default)", "paragraphMarker"}},
        {ParagraphStartMarker::SPACE, "SPACE", " ", {"Double space (  )", "paragraphMarker"}},
        {ParagraphStartMarker::PILCROW, "PILCROW", "¶", {"Pilcrow (¶)", "paragraphMarker"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(ParagraphStartMarker);

// ─────────────────────────────────────────────────────────────────────────────
// Document formatting
// ─────────────────────────────────────────────────────────────────────────────

enum class ReportLineIndentation : uint8_t {
    OFF = 0,
    SPEECH = 1,
    TONES = 2,
    SPEECH_AND_TONES = 3,
};

template <>
struct FamilyTraits<ReportLineIndentation> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "ReportLineIndentation";
    static constexpr StorageKind kKind = StorageKind::kInteger;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<ReportLineIndentation, storage_type>, 4> kMembers{{
        {ReportLineIndentation::OFF, "OFF", 0, {"Off", "line indentation setting"}},
        {ReportLineIndentation::SPEECH, "SPEECH", 1, {"Speech", "line indentation setting"}},
        {ReportLineIndentation::TONES, "TONES", 2, {"Tones", "line indentation setting"}},
        {ReportLineIndentation::SPEECH_AND_TONES, "SPEECH_AND_TONES", 3,
         {"Both Speech and Tones", "line indentation setting"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(ReportLineIndentation);

enum class ReportTableHeaders : uint8_t {
    OFF = 0,
    ROWS_AND_COLUMNS = 1,
    ROWS = 2,
    COLUMNS = 3,
};

template <>
struct FamilyTraits<ReportTableHeaders> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "ReportTableHeaders";
    static constexpr StorageKind kKind = StorageKind::kInteger;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<ReportTableHeaders, storage_type>, 4> kMembers{{
        {ReportTableHeaders::OFF, "OFF", 0, {"Off"}},
        {ReportTableHeaders::ROWS_AND_COLUMNS, "ROWS_AND_COLUMNS", 1, {"Rows and columns"}},
        {ReportTableHeaders::ROWS, "ROWS", 2, {"Rows"}},
        {ReportTableHeaders::COLUMNS, "COLUMNS", 3, {"Columns"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(ReportTableHeaders);

enum class ReportCellBorders : uint8_t {
    OFF = 0,
    STYLE = 1,
    COLOR_AND_STYLE = 2,
};

template <>
struct FamilyTraits<ReportCellBorders> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "ReportCellBorders";
    static constexpr StorageKind kKind = StorageKind::kInteger;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<ReportCellBorders, storage_type>, 3> kMembers{{
        {ReportCellBorders::OFF, "OFF", 0, {"Off"}},
        {ReportCellBorders::STYLE, "STYLE", 1, {"Styles"}},
        {ReportCellBorders::COLOR_AND_STYLE, "COLOR_AND_STYLE", 2, {"Both Colors and Styles"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(ReportCellBorders);

/**
 * @brief Ways to output information such as font attributes
 */
enum class OutputMode : uint8_t {
    OFF = 0b00,
    SPEECH = 0b01,
    BRAILLE = 0b10,
    SPEECH_AND_BRAILLE = SPEECH | BRAILLE,
};

template <>
struct FamilyTraits<OutputMode> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "OutputMode";
    static constexpr StorageKind kKind = StorageKind::kIntegerFlags;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<OutputMode, storage_type>, 4> kMembers{{
        {OutputMode::OFF, "OFF", 0b00, {"Off"}},
        {OutputMode::SPEECH, "SPEECH", 0b01, {"Speech"}},
        {OutputMode::BRAILLE, "BRAILLE", 0b10, {"Braille"}},
        {OutputMode::SPEECH_AND_BRAILLE, "SPEECH_AND_BRAILLE", 0b11, {"Speech and braille"}},
    }};
};

CONFFLAGS_FLAG_OPERATORS(OutputMode);
CONFFLAGS_VERIFY_FAMILY(OutputMode);

/**
 * @brief Report for text in a language the synthesizer does not support
 */
enum class ReportNotSupportedLanguage : uint8_t {
    SPEECH,
    BEEP,
    OFF,
};

template <>
struct FamilyTraits<ReportNotSupportedLanguage> {
    using storage_type = std::string_view;
    static constexpr std::string_view kName = "ReportNotSupportedLanguage";
    static constexpr StorageKind kKind = StorageKind::kString;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<ReportNotSupportedLanguage, storage_type>, 3> kMembers{{
        {ReportNotSupportedLanguage::SPEECH, "SPEECH", "speech", {"Speech", "reportLanguage"}},
        {ReportNotSupportedLanguage::BEEP, "BEEP", "beep", {"Beep", "reportLanguage"}},
        {ReportNotSupportedLanguage::OFF, "OFF", "off", {"Off", "reportLanguage"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(ReportNotSupportedLanguage);

// ─────────────────────────────────────────────────────────────────────────────
// Add-on store
// ─────────────────────────────────────────────────────────────────────────────

enum class AddonsAutomaticUpdate : uint8_t {
    NOTIFY,
    UPDATE,
    DISABLED,
};

template <>
struct FamilyTraits<AddonsAutomaticUpdate> {
    using storage_type = std::string_view;
    static constexpr std::string_view kName = "AddonsAutomaticUpdate";
    static constexpr StorageKind kKind = StorageKind::kString;
    static constexpr bool kContinuous = false;
    static constexpr std::array<MemberDef<AddonsAutomaticUpdate, storage_type>, 3> kMembers{{
        {AddonsAutomaticUpdate::NOTIFY, "NOTIFY", "notify", {"Notify"}},
        {AddonsAutomaticUpdate::UPDATE, "UPDATE", "update", {"Update Automatically"}},
        {AddonsAutomaticUpdate::DISABLED, "DISABLED", "disabled", {"Disabled"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(AddonsAutomaticUpdate);

// ─────────────────────────────────────────────────────────────────────────────
// Remote access
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Role of this computer in a remote session
 *
 * Kept as an integer so further roles can be added after LEADER.
 */
enum class RemoteConnectionMode : uint8_t {
    FOLLOWER = 0,
    LEADER = 1,
};

template <>
struct FamilyTraits<RemoteConnectionMode> {
    using storage_type = int64_t;
    static constexpr std::string_view kName = "RemoteConnectionMode";
    static constexpr StorageKind kKind = StorageKind::kInteger;
    static constexpr bool kContinuous = true;
    static constexpr std::array<MemberDef<RemoteConnectionMode, storage_type>, 2> kMembers{{
        {RemoteConnectionMode::FOLLOWER, "FOLLOWER", 0,
         {"Allow this computer to be controlled", "remote"}},
        {RemoteConnectionMode::LEADER, "LEADER", 1, {"Control another computer", "remote"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(RemoteConnectionMode);

/// Connection role understood by the remote-control subsystem
inline constexpr std::array<Mapping<RemoteConnectionMode, remote::ConnectionMode>, 2>
    kConnectionModeMapping{{
        {RemoteConnectionMode::LEADER, remote::ConnectionMode::kLeader},
        {RemoteConnectionMode::FOLLOWER, remote::ConnectionMode::kFollower},
    }};

static_assert(covers_all_members(kConnectionModeMapping),
              "Every RemoteConnectionMode needs a remote::ConnectionMode");

constexpr remote::ConnectionMode to_connection_mode(RemoteConnectionMode mode) {
    return map_member(kConnectionModeMapping, mode);
}

/**
 * @brief Relay server used for remote sessions
 */
enum class RemoteServerType : uint8_t {
    EXISTING,
    LOCAL,
};

template <>
struct FamilyTraits<RemoteServerType> {
    using storage_type = bool;
    static constexpr std::string_view kName = "RemoteServerType";
    static constexpr StorageKind kKind = StorageKind::kBooleanFlag;
    static constexpr bool kContinuous = true;
    static constexpr std::array<MemberDef<RemoteServerType, storage_type>, 2> kMembers{{
        {RemoteServerType::EXISTING, "EXISTING", false, {"Use existing", "remote"}},
        {RemoteServerType::LOCAL, "LOCAL", true, {"Host locally", "remote"}},
    }};
};

CONFFLAGS_VERIFY_FAMILY(RemoteServerType);

}  // namespace confflags
