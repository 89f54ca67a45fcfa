/***
 * Name: stackscope::rt umbrella header
 * Purpose: Aggregate the public runtime API headers.
 */
#pragma once

#include "stackscope/runtime/IdGenerator.h"
#include "stackscope/runtime/BindingStore.h"
#include "stackscope/runtime/Context.h"
#include "stackscope/runtime/Relay.h"
#include "stackscope/runtime/AddressIndex.h"
#include "stackscope/runtime/Decoder.h"
#include "stackscope/runtime/Scope.h"
#include "stackscope/runtime/ScopeStats.h"
