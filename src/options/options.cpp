/**
 * @file options.cpp
 * @brief Registration of the application's option families
 */

#include "confflags/options.hpp"

#include "common/logger.hpp"
#include "common/macros.hpp"
#include "confflags/registry.hpp"

namespace confflags {

namespace {

std::unique_ptr<Registry> build_options() {
    auto registry = std::make_unique<Registry>();

    registry->add_family_or_die<NVDAKey>();
    registry->add_family_or_die<TypingEcho>();
    registry->add_family_or_die<ShowMessages>();
    registry->add_family_or_die<TetherTo>();
    registry->add_family_or_die<BrailleMode>();
    registry->add_family_or_die<ReportLineIndentation>();
    registry->add_family_or_die<ReportTableHeaders>();
    registry->add_family_or_die<ReportCellBorders>();
    registry->add_family_or_die<AddonsAutomaticUpdate>();
    registry->add_family_or_die<OutputMode>();
    registry->add_family_or_die<ParagraphStartMarker>();
    registry->add_family_or_die<ReportNotSupportedLanguage>();
    registry->add_family_or_die<RemoteConnectionMode>();
    registry->add_family_or_die<RemoteServerType>();

    Status status = validate_mapping("remote::ConnectionMode", kConnectionModeMapping);
    if (!status.ok()) {
        LOG_CRITICAL("Invalid connection mode mapping: {}", status.to_string());
    }
    CONFFLAGS_CHECK(status.ok(), status.to_string());

    LOG_INFO("Registered {} option families", registry->size());
    return registry;
}

}  // namespace

const Registry& Registry::options() {
    static const std::unique_ptr<Registry> registry = build_options();
    return *registry;
}

}  // namespace confflags
