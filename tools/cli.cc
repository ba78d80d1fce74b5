#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "mediadup/engine.hh"
#include "mediadup/evidence.hh"
#include "mediadup/manifest.hh"
#include "mediadup/oss.hh"
#include "mediadup/parse_size.hh"
#include "mediadup/text.hh"

using namespace std::literals;

namespace {

void print_groups(const mediadup::scan_result_t& result,
                  const mediadup::thresholds_t& thresholds) {
  for (const auto& group : result.groups) {
    std::cout << "----\n";
    std::cout << "group " << group.group_id
              << " media=" << mediadup::to_string(group.media)
              << " confidence=" << mediadup::to_fixed(group.confidence, 2)
              << " reclaimable=" << group.reclaimable_size()
              << (group.incomplete ? " incomplete" : "") << '\n';
    for (const auto& member : group.members) {
      bool keeper = group.keeper.has_value() && *group.keeper == member.file_id;
      std::cout << (keeper ? "* " : "  ") << member.file_id
                << " confidence=" << mediadup::to_fixed(member.confidence, 2)
                << '\n';
    }
    for (const auto& item : mediadup::format_evidence(group, thresholds)) {
      std::cout << "    " << mediadup::to_line(item) << '\n';
    }
  }
  std::cout << "----\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string manifest_path = "-";
  mediadup::thresholds_t thresholds;
  mediadup::scan_options_t options;
  options.max_thread = 8;
  bool print_out = false;

  try {
    for (int i = 1; i < argc; ++i) {
      auto need_value = [&](const char* what) -> std::string_view {
        ++i;
        if (i >= argc) {
          throw std::invalid_argument("missing "s + what);
        }
        return argv[i];
      };
      if (argv[i] == "-i"sv) {
        manifest_path = need_value("manifest");
      } else if (argv[i] == "-j"sv) {
        auto max_thread = std::stoi(std::string(need_value("max_thread")));
        if (max_thread <= 0 || max_thread > 256) {
          std::cerr << "jobs must be > 0 and <= 256" << std::endl;
          return 1;
        }
        options.max_thread = static_cast<uint32_t>(max_thread);
      } else if (argv[i] == "-d"sv) {
        thresholds.image_distance = static_cast<uint32_t>(
            std::stoul(std::string(need_value("image_distance"))));
      } else if (argv[i] == "-v"sv) {
        thresholds.video_frame_distance = static_cast<uint32_t>(
            std::stoul(std::string(need_value("video_frame_distance"))));
      } else if (argv[i] == "-m"sv) {
        options.hint.memory_budget =
            mediadup::utils::parse_size(need_value("memory_budget"));
      } else if (argv[i] == "--cpu-pressure"sv) {
        options.hint.cpu_pressure =
            std::stod(std::string(need_value("cpu_pressure")));
      } else if (argv[i] == "--group-confidence"sv) {
        auto policy = need_value("group_confidence");
        if (policy == "min"sv || policy == "minimum"sv) {
          thresholds.group_confidence = mediadup::group_confidence_t::minimum;
        } else if (policy == "max"sv || policy == "maximum"sv) {
          thresholds.group_confidence = mediadup::group_confidence_t::maximum;
        } else if (policy == "mean"sv) {
          thresholds.group_confidence = mediadup::group_confidence_t::mean;
        } else {
          std::cerr << "unknown group confidence policy: " << policy
                    << std::endl;
          return 1;
        }
      } else if (argv[i] == "--ignore"sv) {
        auto pair = need_value("ignored pair");
        auto comma = pair.find(',');
        if (comma == std::string_view::npos || comma == 0 ||
            comma + 1 == pair.size()) {
          std::cerr << "--ignore expects ID,ID: " << pair << std::endl;
          return 1;
        }
        thresholds.ignore_pair(pair.substr(0, comma), pair.substr(comma + 1));
      } else if (argv[i] == "--no-policies"sv) {
        thresholds.policies = {false, false, false};
      } else if (argv[i] == "--time-budget"sv) {
        options.time_budget = std::chrono::milliseconds(
            std::stoll(std::string(need_value("time_budget"))));
      } else if (argv[i] == "--max-bucket"sv) {
        thresholds.limits.max_bucket_size = static_cast<uint32_t>(
            std::stoul(std::string(need_value("max_bucket_size"))));
      } else if (argv[i] == "--max-comparisons"sv) {
        thresholds.limits.max_comparisons_per_bucket =
            std::stoull(std::string(need_value("max_comparisons")));
      } else if (argv[i] == "-q"sv || argv[i] == "--quiet"sv) {
        mediadup::set_log_stream(nullptr);
      } else if (argv[i] == "-p"sv || argv[i] == "--print"sv) {
        print_out = true;
      } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
        std::cerr << "usage: [-i manifest.tsv] [-j jobs] [-d image_distance] "
                     "[-v video_frame_distance] [-m memory_budget] "
                     "[--cpu-pressure 0..1] [--group-confidence min|max|mean] "
                     "[--ignore ID,ID]... [--no-policies] [--time-budget ms] "
                     "[--max-bucket n] [--max-comparisons n] "
                     "[-q/--quiet] [-p/--print] [-h/--help]"
                  << std::endl;
        return 0;
      } else {
        std::cerr << "unknown option: " << argv[i] << std::endl;
        return 1;
      }
    }

    mediadup::file_record_vec records;
    if (manifest_path == "-") {
      records = mediadup::parse_manifest(std::cin);
    } else {
      std::ifstream is(manifest_path);
      if (!is.is_open()) {
        std::cerr << "[err] cannot open manifest: " << manifest_path
                  << std::endl;
        return 1;
      }
      records = mediadup::parse_manifest(is);
    }

    auto result = mediadup::scan(records, thresholds, options);
    if (print_out) {
      print_groups(result, thresholds);
    }
  } catch (const mediadup::config_error& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  } catch (const mediadup::manifest_error& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }
}
