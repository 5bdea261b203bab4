#include "mall/core/types.h"

namespace mall {

const char* errorName(MallError error) noexcept {
    switch (error) {
        case MallError::Ok: return "Ok";
        case MallError::InvalidPolygon: return "InvalidPolygon";
        case MallError::SelfIntersecting: return "SelfIntersecting";
        case MallError::NotContained: return "NotContained";
        case MallError::Overlap: return "Overlap";
        case MallError::VertexCountViolation: return "VertexCountViolation";
        case MallError::ConnectionRuleViolation: return "ConnectionRuleViolation";
        case MallError::NotFound: return "NotFound";
        case MallError::DuplicateId: return "DuplicateId";
        case MallError::DuplicateLevel: return "DuplicateLevel";
        case MallError::LastFloor: return "LastFloor";
        case MallError::InvalidArgument: return "InvalidArgument";
        case MallError::InvalidDocument: return "InvalidDocument";
        case MallError::UnsupportedVersion: return "UnsupportedVersion";
        case MallError::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

} // namespace mall
