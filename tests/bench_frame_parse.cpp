// bench_frame_parse.cpp
//
// Measures the cost of the parse-from-offset-zero contract: a caller that
// receives a frame in chunks re-parses the whole buffer after every read.

#include "gemframe/protocol/byte_cursor.hpp"
#include "gemframe/protocol/request.hpp"
#include "gemframe/protocol/response.hpp"

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace gemframe {
namespace {

[[nodiscard]] auto make_response(std::size_t meta_len) -> std::string {
  return "20 " + std::string(meta_len, 'm') + "\r\n";
}

[[nodiscard]] auto make_request(std::size_t path_len) -> std::string {
  return "gemini://example.com/" + std::string(path_len, 'p') + "\r\n";
}

void BM_ResponseParseWhole(benchmark::State &state) {
  const auto frame = make_response(static_cast<std::size_t>(state.range(0)));
  const auto buf = protocol::as_bytes(frame);

  for (auto _ : state) {
    protocol::Response res;
    auto r = res.parse(buf);
    if (!r || r->is_partial()) {
      state.SkipWithError("response did not complete");
      return;
    }
    benchmark::DoNotOptimize(res.meta);
  }

  state.SetBytesProcessed(static_cast<int64_t>(frame.size()) *
                          state.iterations());
}

// Frame delivered in `chunk`-byte reads, each followed by a full re-parse.
void BM_ResponseReparseChunked(benchmark::State &state) {
  const auto frame = make_response(protocol::kMetaMaxLength);
  const auto chunk = static_cast<std::size_t>(state.range(0));

  for (auto _ : state) {
    protocol::Response res;
    for (std::size_t end = chunk;; end += chunk) {
      const auto n = end < frame.size() ? end : frame.size();
      auto r =
          res.parse(protocol::as_bytes(std::string_view(frame).substr(0, n)));
      if (!r) {
        state.SkipWithError(r.error().message().c_str());
        return;
      }
      if (r->is_complete()) {
        break;
      }
    }
    benchmark::DoNotOptimize(res.status);
  }
}

void BM_RequestParseWhole(benchmark::State &state) {
  const auto frame = make_request(static_cast<std::size_t>(state.range(0)));
  const auto buf = protocol::as_bytes(frame);

  for (auto _ : state) {
    protocol::Request req;
    auto r = req.parse(buf);
    if (!r || r->is_partial()) {
      state.SkipWithError("request did not complete");
      return;
    }
    benchmark::DoNotOptimize(r->value());
  }

  state.SetBytesProcessed(static_cast<int64_t>(frame.size()) *
                          state.iterations());
}

BENCHMARK(BM_ResponseParseWhole)->Arg(16)->Arg(256)->Arg(1024);
BENCHMARK(BM_ResponseReparseChunked)->Arg(1)->Arg(64)->Arg(512);
BENCHMARK(BM_RequestParseWhole)->Arg(16)->Arg(256)->Arg(1000);

} // namespace
} // namespace gemframe
