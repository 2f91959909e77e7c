//----------------------------------------------------------------------------------------------------------------------
// File: CallbackIteration.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class CallbackIteration : std::uint8_t { Continue, Stop };

//----------------------------------------------------------------------------------------------------------------------
