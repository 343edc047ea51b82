#pragma once

// tradewire - inbound message dispatch for EWrapper-style trading clients

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "message.hpp"
#include "type_registry.hpp"
#include "listener.hpp"
#include "diagnostics.hpp"
#include "error_adapter.hpp"
#include "receiver.hpp"
