/**
 * @file validation_test.cpp
 * @brief Unit tests for definition-time family checks
 */

#include <gtest/gtest.h>

#include <string>

#include "confflags/family.hpp"

namespace confflags {
namespace {

FamilySpec connection_mode_spec(int64_t leader_value) {
    FamilySpec spec;
    spec.name = "RemoteConnectionMode";
    spec.kind = StorageKind::kInteger;
    spec.continuous = true;
    spec.members = {
        {"FOLLOWER", StorageValue(int64_t{0}), {"Allow this computer to be controlled", "remote"}},
        {"LEADER", StorageValue(leader_value), {"Control another computer", "remote"}},
    };
    return spec;
}

bool mentions(const Status& status, const std::string& text) {
    return std::string(status.message()).find(text) != std::string::npos;
}

TEST(ValidationTest, ContinuousFamilyPasses) {
    EXPECT_TRUE(validate_family(connection_mode_spec(1)).ok());
}

TEST(ValidationTest, GapFailsContinuity) {
    auto status = validate_family(connection_mode_spec(2));
    EXPECT_EQ(status.code(), StatusCode::kDiscontinuous);
    EXPECT_TRUE(mentions(status, "RemoteConnectionMode.LEADER=2"));
    EXPECT_TRUE(mentions(status, "RemoteConnectionMode.FOLLOWER=0"));
}

TEST(ValidationTest, GapAllowedWhenNotContinuous) {
    FamilySpec spec = connection_mode_spec(2);
    spec.continuous = false;
    EXPECT_TRUE(validate_family(spec).ok());
}

TEST(ValidationTest, ContinuityStartsAtMinimum) {
    FamilySpec spec;
    spec.name = "Level";
    spec.kind = StorageKind::kInteger;
    spec.continuous = true;
    spec.members = {
        {"HIGH", StorageValue(7), {"High"}},
        {"LOW", StorageValue(5), {"Low"}},
        {"MEDIUM", StorageValue(6), {"Medium"}},
    };
    EXPECT_TRUE(validate_family(spec).ok());
}

TEST(ValidationTest, ContinuityIgnoresComposites) {
    FamilySpec spec;
    spec.name = "Channel";
    spec.kind = StorageKind::kIntegerFlags;
    spec.continuous = true;
    spec.members = {
        {"OFF", StorageValue(0), {"Off"}},
        {"LEFT", StorageValue(1), {"Left"}},
        {"RIGHT", StorageValue(2), {"Right"}},
        {"BOTH", StorageValue(3), {"Both"}},
    };
    EXPECT_TRUE(validate_family(spec).ok());

    // 1 and 4 are single bits, so the gap counts
    spec.members[2].value = StorageValue(4);
    spec.members[3].value = StorageValue(5);
    EXPECT_EQ(validate_family(spec).code(), StatusCode::kDiscontinuous);
}

TEST(ValidationTest, BooleanFlagContinuity) {
    FamilySpec spec;
    spec.name = "RemoteServerType";
    spec.kind = StorageKind::kBooleanFlag;
    spec.continuous = true;
    spec.members = {
        {"EXISTING", StorageValue(false), {"Use existing", "remote"}},
        {"LOCAL", StorageValue(true), {"Host locally", "remote"}},
    };
    EXPECT_TRUE(validate_family(spec).ok());
}

TEST(ValidationTest, DuplicateValue) {
    FamilySpec spec;
    spec.name = "TypingEcho";
    spec.kind = StorageKind::kInteger;
    spec.members = {
        {"OFF", StorageValue(0), {"Off"}},
        {"EDIT_CONTROLS", StorageValue(1), {"Only in edit controls"}},
        {"ALWAYS", StorageValue(1), {"Always"}},
    };
    auto status = validate_family(spec);
    EXPECT_EQ(status.code(), StatusCode::kDuplicateValue);
    EXPECT_TRUE(mentions(status, "TypingEcho.ALWAYS"));
    EXPECT_TRUE(mentions(status, "EDIT_CONTROLS"));
}

TEST(ValidationTest, DuplicateStringValue) {
    FamilySpec spec;
    spec.name = "TetherTo";
    spec.kind = StorageKind::kString;
    spec.members = {
        {"AUTO", StorageValue("auto"), {"automatically"}},
        {"FOCUS", StorageValue("auto"), {"to focus"}},
    };
    EXPECT_EQ(validate_family(spec).code(), StatusCode::kDuplicateValue);
}

TEST(ValidationTest, MissingLabel) {
    FamilySpec spec;
    spec.name = "ShowMessages";
    spec.kind = StorageKind::kInteger;
    spec.members = {
        {"DISABLED", StorageValue(0), {"Disabled"}},
        {"USE_TIMEOUT", StorageValue(1), {}},
    };
    auto status = validate_family(spec);
    EXPECT_EQ(status.code(), StatusCode::kMissingLabel);
    EXPECT_TRUE(mentions(status, "ShowMessages.USE_TIMEOUT"));
}

TEST(ValidationTest, ShapeErrors) {
    FamilySpec empty;
    empty.name = "Empty";
    EXPECT_EQ(validate_family(empty).code(), StatusCode::kInvalidDefinition);

    FamilySpec wrong_type;
    wrong_type.name = "TetherTo";
    wrong_type.kind = StorageKind::kString;
    wrong_type.members = {{"AUTO", StorageValue(0), {"automatically"}}};
    EXPECT_EQ(validate_family(wrong_type).code(), StatusCode::kInvalidDefinition);

    FamilySpec negative;
    negative.name = "Level";
    negative.members = {{"BELOW", StorageValue(-1), {"Below"}}};
    EXPECT_EQ(validate_family(negative).code(), StatusCode::kInvalidDefinition);

    FamilySpec repeated_name;
    repeated_name.name = "Level";
    repeated_name.members = {
        {"LOW", StorageValue(0), {"Low"}},
        {"LOW", StorageValue(1), {"Lower"}},
    };
    EXPECT_EQ(validate_family(repeated_name).code(), StatusCode::kInvalidDefinition);

    FamilySpec continuous_strings;
    continuous_strings.name = "BrailleMode";
    continuous_strings.kind = StorageKind::kString;
    continuous_strings.continuous = true;
    continuous_strings.members = {{"FOLLOW_CURSORS", StorageValue("followCursors"), {"follow cursors"}}};
    EXPECT_EQ(validate_family(continuous_strings).code(), StatusCode::kInvalidDefinition);
}

}  // namespace
}  // namespace confflags
