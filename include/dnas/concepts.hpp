#pragma once
// core types for the DNAS graph tooling
#include <cstdint>
#include <cstddef>

namespace dnas {

// Node and dimension types
using NodeId = std::size_t;
using Size = std::size_t;
using Dim = std::int64_t;

}
