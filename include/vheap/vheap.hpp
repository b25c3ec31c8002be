#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "heap.hpp"
#include "observer.hpp"

namespace vheap {

template <class Cfg = DefaultCfg>
using Heap = detail::Heap<detail::ExtendedCfg<Cfg>>;

} // namespace vheap
