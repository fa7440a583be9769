/**
 * @file dicom_tag.cpp
 * @brief Text form of dicom_tag
 */

#include "viewer/core/dicom_tag.hpp"

#include <viewer/compat/format.hpp>

namespace viewer::core {

auto dicom_tag::to_string() const -> std::string {
    return viewer::compat::format("({:04X},{:04X})", group_, element_);
}

}  // namespace viewer::core
