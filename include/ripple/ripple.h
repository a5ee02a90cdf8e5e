#pragma once

// Fine-grained reactive cells, derived cells and effects.
//
//   auto rt = ripple::runtime{};
//   auto a = rt.cell(1);
//   auto b = rt.derived([=] { return a() * 2; });
//   rt.effect([=] { fmt::print("{}\n", b()); }); // prints 2
//   a = 5;                                       // prints 10

#include "cell.h"
#include "config.h"
#include "containers.h"
#include "derived.h"
#include "effect.h"
#include "engine.h"
#include "errors.h"
#include "log.h"
#include "resource.h"
#include "runtime.h"
