/*
==============================================================================
	File: IRelaySink.h
	Desc: Receiver for raw module bytes forwarded by the module relay poller
	(the console's serial terminal / monitor server). Called on the poller
	thread; implementations must be thread safe.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <string>
#include "../utils/Types.h"

struct IRelaySink_S {
	virtual ~IRelaySink_S() = default;
	virtual void on_module_bytes(std::size_t slot, const std::string& moduleName, const bytes_T& bytes) = 0;
}; // IRelaySink_S
