#pragma once
#include <reina/framing/envelope.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace reina::framing {

inline constexpr std::size_t kDefaultChunkSize = 512;

struct parallel_options final {
  /// Inputs handed to one worker at a time. Must be non-zero.
  std::size_t chunk_size{kDefaultChunkSize};
  /// 0 selects std::thread::hardware_concurrency().
  std::size_t worker_threads{0};
};

/// Number of pool threads to start for chunk_count chunks, never more than
/// there are chunks. A zero chunk size is invalid_data.
schema::encoding::wire::result_t<std::size_t> resolve_worker_threads(
    const parallel_options& options,
    std::size_t chunk_count);

/// Chunks needed to cover input_size inputs, rounding up without wrapping
/// for any non-zero chunk_size.
schema::encoding::wire::result_t<std::size_t> count_chunks(
    std::size_t input_size,
    std::size_t chunk_size);

/// Adds size to total, failing with overflow instead of wrapping.
schema::encoding::wire::result_t<void> accumulate_size(std::size_t& total,
                                                       std::size_t size);

/// One envelope around many records:
/// [u32 length][record 0][record 1]...[BLAKE3 of all records].
/// A single flipped bit anywhere invalidates the whole batch.
template <typename T>
schema::encoding::wire::result_t<schema::bytes_t> serialize_batch(
    const std::vector<T>& items,
    const schema::encoding::wire::endianness order) {
  namespace wire = reina::schema::encoding::wire;
  auto payload_size = std::size_t{0};
  for (const auto& item : items) {
    if (auto r = accumulate_size(payload_size, wire::encoded_size(item));
        r.has_error()) {
      return r.error();
    }
  }
  auto total = envelope_size(payload_size);
  if (total.has_error()) {
    return total.error();
  }
  auto output = schema::bytes_t{};
  output.reserve(total.value());
  output.resize(kLengthPrefixSize);
  for (const auto& item : items) {
    auto encoded = wire::encode(item, order);
    if (encoded.has_error()) {
      return encoded.error();
    }
    output.insert(std::end(output), std::begin(encoded.value()),
                  std::end(encoded.value()));
  }
  if (output.size() != kLengthPrefixSize + payload_size) {
    return wire::codec_error_t{wire::invalid_data{"encoded size mismatch"}};
  }
  output.resize(total.value());
  if (auto r = seal_envelope(output, payload_size, order); r.has_error()) {
    return r.error();
  }
  spdlog::debug("serialized batch of {} record(s), {} payload byte(s)",
                items.size(), payload_size);
  return output;
}

/// Verifies the batch envelope, then decodes records back to back until the
/// payload is exhausted. Records delimit themselves; a payload that ends
/// inside a record fails the whole call.
template <typename T>
schema::encoding::wire::result_t<std::vector<T>> deserialize_batch(
    const schema::bytes_view_t& buffer,
    const schema::encoding::wire::endianness order) {
  namespace wire = reina::schema::encoding::wire;
  auto payload = open_envelope(buffer, order);
  if (payload.has_error()) {
    return payload.error();
  }
  const auto records = payload.value();
  auto items = std::vector<T>{};
  auto offset = std::size_t{0};
  while (offset < records.size()) {
    auto item = T{};
    auto consumed = wire::decode_from(records.subspan(offset), order, item);
    if (consumed.has_error()) {
      spdlog::debug("batch record {} at offset {} failed to decode",
                    items.size(), offset);
      return consumed.error();
    }
    offset += consumed.value();
    items.push_back(std::move(item));
  }
  spdlog::debug("deserialized batch of {} record(s)", items.size());
  return items;
}

/// Decodes independently framed envelopes on a thread pool. Inputs are split
/// into contiguous chunks of options.chunk_size (the last one may be short);
/// each chunk is decoded in order by one worker into its own slot, and the
/// slots are joined in chunk order so output order equals input order.
///
/// Fail-fast: if any input fails, the error of the lowest failing index is
/// returned and no partial results are. An exception thrown while decoding
/// (allocation failure) counts as that input's io_error.
template <typename T>
schema::encoding::wire::result_t<std::vector<T>> parallel_deserialize(
    const std::vector<schema::bytes_t>& buffers,
    const schema::encoding::wire::endianness order,
    const parallel_options& options = {}) {
  namespace wire = reina::schema::encoding::wire;
  auto counted = count_chunks(buffers.size(), options.chunk_size);
  if (counted.has_error()) {
    return counted.error();
  }
  if (buffers.empty()) {
    return std::vector<T>{};
  }
  const auto chunk_count = counted.value();
  auto threads = resolve_worker_threads(options, chunk_count);
  if (threads.has_error()) {
    return threads.error();
  }

  struct failure final {
    std::size_t index{};
    wire::codec_error_t error;
  };
  auto chunks = std::vector<std::vector<T>>(chunk_count);
  auto failures = std::vector<std::optional<failure>>(chunk_count);
  // Lowest chunk that has failed so far; later chunks need not run.
  auto first_failed = std::atomic<std::size_t>{chunk_count};

  {
    auto pool = boost::asio::thread_pool{threads.value()};
    for (auto chunk = std::size_t{0}; chunk < chunk_count; ++chunk) {
      boost::asio::post(pool, [&, chunk]() {
        // chunk < chunk_count, so begin < buffers.size() and cannot wrap.
        const auto begin = chunk * options.chunk_size;
        const auto end =
            begin + std::min(options.chunk_size, buffers.size() - begin);
        auto mark_failed = [&](const std::size_t index,
                               wire::codec_error_t error) {
          failures[chunk] = failure{index, std::move(error)};
          auto current = first_failed.load(std::memory_order_relaxed);
          while (chunk < current &&
                 !first_failed.compare_exchange_weak(
                     current, chunk, std::memory_order_relaxed)) {
          }
        };
        auto i = begin;
        try {
          auto& out = chunks[chunk];
          out.reserve(end - begin);
          for (; i < end; ++i) {
            if (first_failed.load(std::memory_order_relaxed) < chunk) {
              return;
            }
            auto value = deserialize<T>(buffers[i], order);
            if (value.has_error()) {
              mark_failed(i, value.error());
              return;
            }
            out.push_back(std::move(value).value());
          }
        } catch (const std::exception& e) {
          mark_failed(i, wire::codec_error_t{wire::io_error{
                             std::string{"decode worker failed: "} +
                             e.what()}});
        }
      });
    }
    pool.join();
  }

  for (auto& slot : failures) {
    if (slot) {
      spdlog::warn("parallel decode of {} input(s) aborted at index {}: {}",
                   buffers.size(), slot->index,
                   wire::to_string(slot->error));
      return std::move(slot->error);
    }
  }

  auto items = std::vector<T>{};
  items.reserve(buffers.size());
  for (auto& chunk : chunks) {
    std::move(std::begin(chunk), std::end(chunk), std::back_inserter(items));
  }
  return items;
}

}  // namespace reina::framing
