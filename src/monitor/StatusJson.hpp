/*
Snapshot -> JSON for the monitor surface. Hand-built with ostringstream,
one flat object per endpoint:

GET /state
{
  "machine_type": int, "machine_name": str, "firmware": int, "emulator": bool,
  "port": str, "live": bool, "pause": bool, "in_state_matrix": bool,
  "being_used": bool, "desynchronized": bool, "n_analog_samples": int,
  "current_panel": int, "current_state": str, "protocol": str, "subject": str,
  "flex_types": [int], "sampling_rate_hz": int, "relay_slot": int (-1 = idle)
}
GET /layout  { "events": [str], "inputs": [str], "outputs": [str] }
GET /modules { "modules": [ {"slot","name","connected","relay_active","firmware","usb_port"} ] }
GET /relay   { "chunks": [ {"slot","module","bytes":[int]} ], "dropped": int }
*/
#pragma once
#include <string>
#include <vector>
#include "MonitorFeed.hpp"

class BpodSystem_C;

namespace StatusJson {

std::string state(BpodSystem_C& sys);
std::string layout(BpodSystem_C& sys);
std::string modules(BpodSystem_C& sys);
std::string relay_chunks(const std::vector<RelayChunk_S>& chunks, std::size_t dropped);
// {"ok":bool,"error":str}
std::string result(BpodError_E err);

} // namespace StatusJson
