#include <chrono>
#include <iostream>
#include <string>

#include <json-filter/filter/filter-factory.hpp>
#include <json-filter/path/parser.hpp>
#include <json-filter/util/files.hpp>
#include <json-filter/util/tracer.hpp>
#include <json-filter/json-filter.hpp>
#include <json-filter/error.hpp>

using jsonfilter::Json;

void run_bench(const Json &document, const std::string &data,
               const jsonfilter::Filter &filter, const path::Node &root) {
  std::cout << "Starting benchmark..." << std::endl;

  constexpr size_t WARMUP_ITERS = 5;
  constexpr size_t BENCH_ITERS = 50;

  for (size_t i = 0; i < WARMUP_ITERS; i++) {
    filter.apply(document, root);
  }

  std::cout << "Finished warmup..." << std::endl;

  auto start = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < BENCH_ITERS; i++) {
    util::ScopedTrace trace("filter");
    filter.apply(document, root);
  }

  auto end = std::chrono::high_resolution_clock::now();
  auto avg_runtime = (end - start) / BENCH_ITERS;

  auto seconds = std::chrono::duration<double>(avg_runtime).count();
  double gigabytes = (double)data.size() / 1000 / 1000 / 1000;
  std::cout << "Finished benchmark!" << std::endl;
  std::cout << "filtered on average in " << seconds << "s:" << std::endl;
  std::cout << "size: " << gigabytes << "GB" << std::endl;
  std::cout << "GB/s: " << gigabytes / seconds << std::endl;
}

void run_single(const Json &document, const jsonfilter::Filter &filter, const path::Node &root) {
  auto filtered = [&] {
    util::ScopedTrace trace("filter");
    return filter.apply(document, root);
  }();
  std::cout << filtered.dump(2) << std::endl;
}

int main(int argc, char *argv[]) {
  if (argc < 4) {
    std::cout << "Usage: ./json-filter-bench json inclusion|exclusion paths [--bench] [--trace]" << std::endl;
    return -1;
  }

  bool bench = false;
  bool trace = false;
  for (int i = 4; i < argc; i++) {
    auto flag = std::string(argv[i]);
    if (flag == "--bench") {
      bench = true;
    } else if (flag == "--trace") {
      trace = true;
    } else {
      std::cerr << "Unknown flag: " << flag << std::endl;
      return -1;
    }
  }

  try {
    auto filter_type = jsonfilter::filter_type_from_name(argv[2]);
    const auto &filter = jsonfilter::select_filter(filter_type);

    // Read in JSON file
    std::string data = util::load_file_content(argv[1]);

    Json document;
    {
      util::ScopedTrace parse_trace("parse json");
      document = Json::parse(data);
    }

    // Parse paths from string
    auto root = [&] {
      util::ScopedTrace parse_trace("parse paths");
      return path::Parser().parse(std::string(argv[3]));
    }();

    if (bench) {
      run_bench(document, data, filter, root);
    } else {
      run_single(document, filter, root);
    }
  } catch (const ParseError &e) {
    std::cerr << "Invalid paths: " << e.what() << std::endl;
    return -1;
  } catch (const InvalidFilterType &e) {
    std::cerr << e.what() << std::endl;
    return -1;
  } catch (const Json::exception &e) {
    std::cerr << "Invalid JSON: " << e.what() << std::endl;
    return -1;
  }

  if (trace) {
    auto& tracer = util::Tracer::get_instance();
    tracer.export_traces("traces.csv");
  }

  return 0;
}
