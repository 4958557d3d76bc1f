// File: src/apps/compchat_cli/main.cpp
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "compchat/adapters/channels/memory_channel_registry.hpp"
#include "compchat/adapters/scripted/scripted_backend.hpp"
#include "compchat/adapters/table_dir/caching_dataset_source.hpp"
#include "compchat/adapters/table_dir/table_dir_source.hpp"
#include "compchat/core/events/jsonl_journal_sink.hpp"
#include "compchat/core/model/coordinator.hpp"
#include "compchat/core/model/model_profile.hpp"
#include "compchat/core/model/variant_selector.hpp"
#include "compchat/core/util/config_loader.hpp"
#include "compchat/core/util/repro_hash.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string dataset;
  std::string question;
  std::string strategy{"TABULAR"};
  std::string mode{"none"};
  std::string channel{"cli"};
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (i + 1 < argc) {
      if (s == "--config") { a.config_path = argv[++i]; continue; }
      if (s == "--dataset") { a.dataset = argv[++i]; continue; }
      if (s == "--question") { a.question = argv[++i]; continue; }
      if (s == "--strategy") { a.strategy = argv[++i]; continue; }
      if (s == "--mode") { a.mode = argv[++i]; continue; }
      if (s == "--channel") { a.channel = argv[++i]; continue; }
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "compchat\n"
            << "  --config <path>\n"
            << "  --dataset <id>\n"
            << "  --question <text>\n"
            << "  [--strategy TABULAR|STRUCTURED]   (default TABULAR)\n"
            << "  [--mode none|pull|push]           (default none)\n"
            << "  [--channel <id>]                  (push only, default cli)\n";
}

int report(const compchat::Status& st) {
  std::cerr << compchat::to_string(st) << "\n";
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty() || args.dataset.empty() || args.question.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = compchat::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << compchat::to_string(cfg_r.status()) << "\n";
    return 1;
  }
  const compchat::Config cfg = cfg_r.take_value();

  auto tag_r = compchat::parse_strategy_tag(args.strategy);
  if (!tag_r.ok()) return report(tag_r.status());
  auto mode_r = compchat::parse_delivery_mode(args.mode);
  if (!mode_r.ok()) return report(mode_r.status());

  // Journal
  std::unique_ptr<compchat::JsonlJournalSink> journal;
  if (!cfg.output.journal_dir.empty()) {
    compchat::RunInfo run;
    run.config_path = args.config_path;
    run.journal_dir = cfg.output.journal_dir;
    run.config_hash = compchat::compute_config_hash(cfg);
    run.keep_last = cfg.output.keep_journals;
    run.start_time_ns = compchat::TimestampNs{0};
    run.wall_start_time_ns = compchat::TimestampNs{
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count()};

    journal = std::make_unique<compchat::JsonlJournalSink>();
    const compchat::Status st = journal->open(run);
    if (!st.ok()) {
      std::cerr << compchat::to_string(st) << "\n";
      return 1;
    }
  }

  // Ensure we always flush/close the journal.
  struct Guard {
    compchat::JsonlJournalSink* j;
    ~Guard() {
      if (j != nullptr) j->close();
    }
  } guard{journal.get()};

  // Dataset source
  compchat::TableDirSource table_dir(compchat::TableDirSourceConfig{cfg.dataset.path});
  compchat::CachingDatasetSource cached(table_dir, cfg.dataset.cache_entries, cfg.dataset.cache_ttl_ns);
  compchat::IDatasetSource& source =
      cfg.dataset.cache_entries > 0 ? static_cast<compchat::IDatasetSource&>(cached) : table_dir;

  // Backend
  auto book_r = compchat::ScriptBook::load_file(cfg.backend.script_path);
  if (!book_r.ok()) {
    std::cerr << compchat::to_string(book_r.status()) << "\n";
    return 1;
  }
  compchat::ScriptedBackendFactory factory(std::make_shared<const compchat::ScriptBook>(book_r.take_value()));

  compchat::BackendOptions backend_opts;
  backend_opts.model = cfg.backend.model;
  backend_opts.streaming = cfg.backend.streaming;
  backend_opts.api_key = cfg.backend.api_key;

  const compchat::AgentVariantSelector selector(
      cfg.variants,
      compchat::resolve_model_profile(cfg.backend.model, cfg.models),
      backend_opts,
      factory);

  compchat::MemoryChannelRegistry channels(cfg.transport.channel_capacity,
                                           std::chrono::milliseconds(cfg.transport.send_timeout_ms));

  compchat::Coordinator coordinator(source, selector, &channels, journal.get());

  if (journal) {
    std::cout << "Journal: " << journal->path() << " (latest: " << journal->latest_path() << ")\n";
  }
  std::cout << "Dataset: " << args.dataset << "  strategy=" << compchat::strategy_tag_name(tag_r.value())
            << "  mode=" << compchat::delivery_mode_name(mode_r.value())
            << "  model=" << cfg.backend.model << "\n\n";

  switch (mode_r.value()) {
    case compchat::DeliveryMode::kNone: {
      auto answer_r = coordinator.query(args.dataset, args.question, tag_r.value());
      if (!answer_r.ok()) return report(answer_r.status());
      std::cout << answer_r.value() << "\n";
      return 0;
    }

    case compchat::DeliveryMode::kPull: {
      auto stream_r = coordinator.query_stream_pull(args.dataset, args.question, tag_r.value());
      if (!stream_r.ok()) return report(stream_r.status());
      std::unique_ptr<compchat::EventStream> stream = stream_r.take_value();

      compchat::Event ev;
      while (true) {
        const compchat::Status st = stream->next(&ev);
        if (st.is_eof()) break;
        if (!st.ok()) return report(st);
        std::cout << compchat::to_frame(ev) << "\n";
      }
      return 0;
    }

    case compchat::DeliveryMode::kPush: {
      auto ch_r = channels.open(args.channel);
      if (!ch_r.ok()) return report(ch_r.status());
      std::shared_ptr<compchat::MemoryChannel> ch = ch_r.take_value();

      std::thread printer([ch] {
        std::string frame;
        while (true) {
          const compchat::Status st = ch->receive(&frame, std::chrono::milliseconds(100));
          if (st.is_timeout()) continue;
          if (!st.ok()) break;
          std::cout << frame << "\n";
        }
      });

      auto answer_r = coordinator.query_stream_push(args.dataset, args.question, tag_r.value(), args.channel);

      // Closing ends the printer once queued frames are drained.
      const compchat::Status st_close = channels.close(args.channel);
      printer.join();
      if (!st_close.ok()) std::cerr << compchat::to_string(st_close) << "\n";

      if (!answer_r.ok()) return report(answer_r.status());
      std::cout << "\n" << answer_r.value() << "\n";
      return 0;
    }
  }

  return 2;
}
