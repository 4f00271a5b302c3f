/*
==============================================================================
	File: IAnalogSink.h
	Desc: Session storage side of the analog stream. Receives each poll tick's
	batch of decoded Flex I/O analog samples (in sample order). Called on the
	analog poller thread.
==============================================================================
*/

#pragma once
#include <vector>
#include "../utils/Types.h"

struct IAnalogSink_S {
	virtual ~IAnalogSink_S() = default;
	virtual void on_analog_samples(const std::vector<AnalogSample_S>& batch) = 0;
}; // IAnalogSink_S
