/// @file src/core/error.cpp
/// @brief ErrorCode names.

#include "olend/error.hpp"

namespace olend {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                   return "Ok";
        case ErrorCode::StalePrice:           return "StalePrice";
        case ErrorCode::LowConfidence:        return "LowConfidence";
        case ErrorCode::ManipulationDetected: return "ManipulationDetected";
        case ErrorCode::CircuitOpen:          return "CircuitOpen";
        case ErrorCode::ArithmeticOverflow:   return "ArithmeticOverflow";
        case ErrorCode::ArithmeticUnderflow:  return "ArithmeticUnderflow";
        case ErrorCode::DivisionByZero:       return "DivisionByZero";
        case ErrorCode::InvalidConfig:        return "InvalidConfig";
        case ErrorCode::Unauthorized:         return "Unauthorized";
        case ErrorCode::UnknownAsset:         return "UnknownAsset";
        case ErrorCode::InvalidPrice:         return "InvalidPrice";
        case ErrorCode::LtvExceeded:          return "LtvExceeded";
    }
    return "Unknown";
}

} // namespace olend
