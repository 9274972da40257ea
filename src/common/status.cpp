/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "confflags/status.hpp"

namespace confflags {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:                result = "OK"; break;
        case StatusCode::kUnknownMember:     result = "UnknownMember"; break;
        case StatusCode::kDuplicateValue:    result = "DuplicateValue"; break;
        case StatusCode::kDiscontinuous:     result = "Discontinuous"; break;
        case StatusCode::kMissingLabel:      result = "MissingLabel"; break;
        case StatusCode::kNonExhaustive:     result = "NonExhaustive"; break;
        case StatusCode::kInvalidDefinition: result = "InvalidDefinition"; break;
        case StatusCode::kNotFound:          result = "NotFound"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace confflags
