#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <json-filter/util/tracer.hpp>

namespace util {

uint64_t Tracer::now_ns() {
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

trace_id Tracer::start_trace(std::string task) {
  auto start_ns = now_ns();

  std::lock_guard<std::mutex> guard(tracer_mutex);
  traces.emplace_back(std::move(task), start_ns);
  return traces.size() - 1;
}

void Tracer::finish_trace(trace_id id) {
  auto end_ns = now_ns();

  std::lock_guard<std::mutex> guard(tracer_mutex);
  if (id >= traces.size()) throw std::out_of_range("Tried to finish an unknown trace");

  auto& trace = traces[id];
  trace.duration_ns = end_ns - trace.start_ns;
}

std::vector<Trace> Tracer::get_traces() {
  std::lock_guard<std::mutex> guard(tracer_mutex);
  return traces;
}

void Tracer::clear() {
  std::lock_guard<std::mutex> guard(tracer_mutex);
  traces.clear();
}

void Tracer::export_traces(const std::string &file_name) {
  auto snapshot = get_traces();

  std::ofstream output(file_name);
  if (!output.is_open()) {
    std::cerr << "Could not write traces to: " << file_name << std::endl;
    return;
  }

  output << "task,start_ns,duration_ns" << std::endl;

  if (snapshot.empty()) {
    return;
  }

  auto first_start_ns = snapshot[0].start_ns;

  for (const auto &trace : snapshot) {
    auto start_ns = trace.start_ns - first_start_ns;
    output << trace.task << "," << start_ns << "," << trace.duration_ns << std::endl;
  }
}

} // namespace util
