#pragma once

#include "multicam/multicam.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace multicam {
namespace detail {

void LogError(const std::string& message, const Config* config);
void LogInfo(const std::string& message, const Config* config);
void LogDebug(const std::string& message, const Config* config);

// Wall clock in epoch seconds, honoring Config::clock.
double NowSeconds(const Config& config);

uint32_t ReadBe32(const uint8_t* data);
void WriteBe32(std::vector<uint8_t>& data, size_t offset, uint32_t value);

// Compact single-line JSON.
std::string EncodeEnvelope(const CommandEnvelope& envelope);
bool DecodeEnvelope(const std::string& payload, CommandEnvelope* out);

// True when `buffer` holds exactly one complete JSON value. Bare numbers
// count only at end of stream.
bool TryParseCompleteReply(const std::string& buffer, bool end_of_stream,
                           Json::Value* out);
bool ParseTransferDescriptor(const std::string& block, TransferDescriptor* out,
                             std::string* error);
CommandResult InterpretReply(Command command, const Json::Value& reply);

std::string DescribeDevice(const Device& device);

}  // namespace detail
}  // namespace multicam
