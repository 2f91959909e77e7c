//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Mesh {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Name = "Mesh Coordinator";
constexpr std::string_view Version = "0.1.0";

//----------------------------------------------------------------------------------------------------------------------
} // Mesh namespace
//----------------------------------------------------------------------------------------------------------------------
