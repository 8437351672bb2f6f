#include <reina/framing/batch.hpp>
#include <thread>

namespace reina::framing {

namespace wire = reina::schema::encoding::wire;

using wire::codec_error_t;
using wire::result_t;

result_t<std::size_t> resolve_worker_threads(const parallel_options& options,
                                             const std::size_t chunk_count) {
  if (options.chunk_size == 0) {
    return codec_error_t{wire::invalid_data{"chunk size must be non-zero"}};
  }
  auto threads = options.worker_threads;
  if (threads == 0) {
    threads = std::max(1u, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1, std::min(threads, chunk_count));
}

result_t<std::size_t> count_chunks(const std::size_t input_size,
                                   const std::size_t chunk_size) {
  if (chunk_size == 0) {
    return codec_error_t{wire::invalid_data{"chunk size must be non-zero"}};
  }
  return input_size / chunk_size + (input_size % chunk_size != 0 ? 1 : 0);
}

result_t<void> accumulate_size(std::size_t& total, const std::size_t size) {
  if (size > std::numeric_limits<std::size_t>::max() - total) {
    return codec_error_t{wire::overflow{"batch payload size overflows"}};
  }
  total += size;
  return wire::outcome::success();
}

}  // namespace reina::framing
