#pragma once

/// @file pine.hpp
/// @brief PINE wire protocol: opcode catalog, typed messages and frame codec

#include "pine_error.hpp"
#include "pine_buffer.hpp"
#include "opcodes.hpp"
#include "messages.hpp"
#include "pine_codec.hpp"
