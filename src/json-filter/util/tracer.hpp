#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace util {

using trace_id = size_t;

struct Trace {
  std::string task;
  uint64_t start_ns;
  uint64_t duration_ns = 0;

  Trace(std::string task, uint64_t start_ns)
    : task(std::move(task)), start_ns(start_ns) {}
};

// Process-wide recorder for timing spans, exported as CSV for plotting.
class Tracer {
public:
  static Tracer& get_instance() {
    static Tracer instance;
    return instance;
  }

  trace_id start_trace(std::string task);
  void finish_trace(trace_id id);

  // Returns a snapshot of all recorded traces.
  std::vector<Trace> get_traces();
  void clear();

  // Writes `task,start_ns,duration_ns` rows, start times relative to the
  // first trace.
  void export_traces(const std::string &file_name);
private:
  Tracer() {}

  static uint64_t now_ns();

  std::vector<Trace> traces;

  std::mutex tracer_mutex;
public:
  Tracer(Tracer const&)          = delete;
  void operator=(Tracer const&)  = delete;
};

// Finishes its trace when it goes out of scope.
class ScopedTrace {
public:
  explicit ScopedTrace(std::string task)
    : id(Tracer::get_instance().start_trace(std::move(task))) {}
  ~ScopedTrace() { Tracer::get_instance().finish_trace(id); }

  ScopedTrace(ScopedTrace const&)     = delete;
  void operator=(ScopedTrace const&)  = delete;
private:
  trace_id id;
};

} // namespace util
