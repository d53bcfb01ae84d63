#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <thread>
#include <future>
#include <algorithm>
#include "posix_fd.hpp"

// [start, end) of every line in data[0, n), trailing '\r' excluded.
// A final newline does not open an extra empty line.
static void collect_ranges(const char* data, size_t n, const std::vector<size_t>& nl,
                           std::vector<std::pair<size_t, size_t>>& ranges) {
  ranges.reserve(nl.size() + 1);
  size_t start = 0;
  for (size_t pos : nl) {
    size_t end = pos;
    if (end > start && data[end - 1] == '\r') end--;
    ranges.emplace_back(start, end);
    start = pos + 1;
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    ranges.emplace_back(start, end);
  }
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string() + " (empty)"; return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);

  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  const size_t min_parallel_size = 1 << 20;
  std::vector<size_t> nl;
  if (n < min_parallel_size || hw == 1) {
    for (size_t i = 0; i < n; ++i) if (data[i] == '\n') nl.push_back(i);
  } else {
    unsigned threads = std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size));
    threads = std::max(threads, 2u);
    std::vector<std::vector<size_t>> newline_pos(threads);
    std::vector<std::future<void>> futs;
    size_t chunk = n / threads;
    for (unsigned t = 0; t < threads; ++t) {
      size_t s = t * chunk;
      size_t e = (t + 1 == threads) ? n : (t + 1) * chunk;
      futs.emplace_back(std::async(std::launch::async, [&, s, e, t]{
        auto& vec = newline_pos[t];
        vec.reserve((e - s) / 64 + 1);
        for (size_t i = s; i < e; ++i) {
          if (data[i] == '\n') vec.push_back(i);
        }
      }));
    }
    for (auto& f : futs) f.get();
    size_t total_nl = 0; for (const auto& v : newline_pos) total_nl += v.size();
    nl.reserve(total_nl);
    for (unsigned t = 0; t < threads; ++t) {
      nl.insert(nl.end(), newline_pos[t].begin(), newline_pos[t].end());
    }
  }

  std::vector<std::pair<size_t, size_t>> ranges;
  collect_ranges(data, n, nl, ranges);
  out_lines.resize(ranges.size());
  unsigned tcopy = std::min<unsigned>(hw, static_cast<unsigned>(std::min<size_t>(ranges.size(), hw)));
  if (tcopy <= 1 || ranges.size() < 1024) {
    for (size_t i = 0; i < ranges.size(); ++i) {
      auto [s, e] = ranges[i];
      out_lines[i] = std::string(data + s, e - s);
    }
  } else {
    size_t per = (ranges.size() + tcopy - 1) / tcopy;
    std::vector<std::future<void>> f2;
    for (unsigned t = 0; t < tcopy; ++t) {
      size_t i0 = t * per;
      size_t i1 = std::min(ranges.size(), (t + 1) * per);
      if (i0 >= i1) break;
      f2.emplace_back(std::async(std::launch::async, [&, i0, i1]{
        for (size_t i = i0; i < i1; ++i) {
          auto [s, e] = ranges[i];
          out_lines[i] = std::string(data + s, e - s);
        }
      }));
    }
    for (auto& f : f2) f.get();
  }

  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
