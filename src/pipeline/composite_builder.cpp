#include "gvpreview/pipeline/composite_builder.hpp"
#include "gvpreview/core/errors.hpp"
#include "gvpreview/core/utils.hpp"
#include "gvpreview/image/resize.hpp"
#include "gvpreview/io/image_source.hpp"
#include "gvpreview/layout/grid_mapper.hpp"
#include "gvpreview/metadata/filename_parser.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <utility>

namespace gvpreview::pipeline {

using json = nlohmann::json;

std::string skip_reason_to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::PARSE: return "parse";
        case SkipReason::FORMAT_MISMATCH: return "format_mismatch";
        case SkipReason::INDEX_OUT_OF_RANGE: return "index_out_of_range";
        case SkipReason::UNSUPPORTED_ORDER: return "unsupported_order";
        case SkipReason::DECODE: return "decode";
        case SkipReason::SHAPE_MISMATCH: return "shape_mismatch";
        case SkipReason::OTHER: return "other";
    }
    return "other";
}

CompositeOptions CompositeOptions::from_config(const config::Config& cfg) {
    CompositeOptions opts;
    opts.grid = cfg.grid_dims();
    opts.cell = cfg.cell_size();
    opts.order = cfg.fill_order();
    opts.format = cfg.input_format();
    opts.verbose = cfg.logging.verbose;
    return opts;
}

CompositeBuilder::CompositeBuilder(CompositeOptions options, std::ostream& out,
                                   std::ostream& err, std::ostream* events)
    : options_(std::move(options)),
      out_(out),
      err_(err),
      events_(events),
      run_id_(core::get_run_id()),
      canvas_(options_.grid, options_.cell),
      loader_(io::load_source_image) {}

void CompositeBuilder::enter_phase(Phase phase) {
    phase_ = phase;
    if (events_) {
        emitter_.phase_start(run_id_, phase, *events_);
    }
}

void CompositeBuilder::leave_phase(Phase phase, const std::string& status, const json& extra) {
    if (events_) {
        emitter_.phase_end(run_id_, phase, status, extra, *events_);
    }
}

void CompositeBuilder::begin_run(RunSummary& summary, const std::string& input_label) {
    summary = RunSummary{};
    summary.run_id = run_id_;
    phase_ = Phase::INIT;

    // A run always starts from a black canvas.
    canvas_ = composite::CompositeCanvas(options_.grid, options_.cell);

    out_ << "input: " << input_label << "\n";
    out_ << "dimensions: " << layout::format_xbyy(options_.grid.rows, options_.grid.cols) << "\n";
    if (options_.verbose) {
        out_ << "images:\n";
    }

    if (events_) {
        emitter_.run_start(run_id_,
                           {{"input", input_label},
                            {"dims", layout::format_xbyy(options_.grid.rows, options_.grid.cols)},
                            {"resize", layout::format_xbyy(options_.cell.height, options_.cell.width)},
                            {"order", fill_order_to_string(options_.order)},
                            {"format", image_format_to_string(options_.format)}},
                           *events_);
    }
}

RunSummary CompositeBuilder::run(const fs::path& input, io::RasterSink& sink,
                                 const std::atomic<bool>* stop_flag) {
    RunSummary summary;
    begin_run(summary, input.string());

    enter_phase(Phase::ENUMERATING);
    std::optional<io::ImageSource> source;
    std::vector<Item> items;
    try {
        source.emplace(io::ImageSource::open(input, options_.format, stop_flag));
        for (const auto& warning : source->warnings()) {
            err_ << "Warning: " << warning << "\n";
            if (events_) {
                emitter_.warning(run_id_, warning, *events_);
            }
        }
        for (const auto& f : source->files()) {
            items.push_back({f, source->display_name(f)});
        }
        leave_phase(Phase::ENUMERATING, "ok",
                    {{"candidates", static_cast<int>(items.size())},
                     {"from_archive", source->from_archive()}});
    } catch (const StopRequested&) {
        out_ << "Terminating early due to Ctrl-C\n";
        summary.aborted = true;
        leave_phase(Phase::ENUMERATING, "aborted");
    } catch (const IOError& e) {
        summary.setup_error = e.what();
        err_ << "Cannot enumerate " << input.string() << ": " << e.what() << "\n";
        if (events_) {
            emitter_.error(run_id_, e.what(), *events_);
        }
        leave_phase(Phase::ENUMERATING, "error");
    } catch (const std::exception& e) {
        summary.setup_error = e.what();
        err_ << "Cannot enumerate " << input.string() << ": " << e.what() << "\n";
        if (events_) {
            emitter_.error(run_id_, e.what(), *events_);
        }
        leave_phase(Phase::ENUMERATING, "error");
    }

    if (!summary.aborted && summary.setup_error.empty()) {
        composite_items(items, summary, stop_flag);
    }

    finalize(summary, sink);
    return summary;
}

RunSummary CompositeBuilder::run_files(const std::vector<fs::path>& files, io::RasterSink& sink,
                                       const std::atomic<bool>* stop_flag) {
    RunSummary summary;
    begin_run(summary, std::to_string(files.size()) + " files");

    std::vector<Item> items;
    items.reserve(files.size());
    for (const auto& f : files) {
        items.push_back({f, f.string()});
    }

    composite_items(items, summary, stop_flag);
    finalize(summary, sink);
    return summary;
}

void CompositeBuilder::composite_items(const std::vector<Item>& items, RunSummary& summary,
                                       const std::atomic<bool>* stop_flag) {
    summary.candidates = static_cast<int>(items.size());
    if (events_ && summary.candidates > options_.grid.capacity()) {
        emitter_.warning(run_id_,
                         std::to_string(summary.candidates) + " candidates for " +
                             std::to_string(options_.grid.capacity()) + " cells",
                         *events_);
    }
    enter_phase(Phase::COMPOSITING);

    for (const auto& item : items) {
        // Interrupts are only honoured between items.
        if (stop_flag && stop_flag->load()) {
            out_ << "Terminating early due to Ctrl-C\n";
            summary.aborted = true;
            break;
        }
        const ItemOutcome outcome = process_item(item.file, item.name);
        record(outcome, summary);
        if (on_item_) {
            on_item_(outcome, summary);
        }
    }

    leave_phase(Phase::COMPOSITING, summary.aborted ? "aborted" : "ok",
                {{"placed", summary.placed}, {"skipped", summary.skipped}});
}

ItemOutcome CompositeBuilder::process_item(const fs::path& file, const std::string& display_name) {
    ItemOutcome outcome;
    outcome.item = display_name;

    try {
        const FilenameMetadata meta = metadata::parse_filename(file);
        if (meta.format != options_.format) {
            outcome.reason = SkipReason::FORMAT_MISMATCH;
            outcome.message = "extension " + meta.extension + " is not " +
                              image_format_to_string(options_.format);
            return outcome;
        }

        const GridPosition pos =
            layout::index_to_grid_position(meta.sequence_index, options_.grid, options_.order);

        const SourceImage source = loader_(file, meta);
        const cv::Mat cell = image::downsize(source.pixels, options_.cell);
        canvas_.paste(pos, cell);

        outcome.placed = true;
        outcome.position = pos;
    } catch (const ParseError& e) {
        outcome.reason = SkipReason::PARSE;
        outcome.message = e.what();
    } catch (const IndexOutOfRange& e) {
        outcome.reason = SkipReason::INDEX_OUT_OF_RANGE;
        outcome.message = e.what();
    } catch (const UnsupportedOrder& e) {
        outcome.reason = SkipReason::UNSUPPORTED_ORDER;
        outcome.message = e.what();
    } catch (const DecodeError& e) {
        outcome.reason = SkipReason::DECODE;
        outcome.message = e.what();
    } catch (const ShapeMismatch& e) {
        outcome.reason = SkipReason::SHAPE_MISMATCH;
        outcome.message = e.what();
    } catch (const GvPreviewError& e) {
        outcome.reason = SkipReason::OTHER;
        outcome.message = e.what();
    } catch (const cv::Exception& e) {
        outcome.reason = SkipReason::OTHER;
        outcome.message = std::string("OpenCV: ") + e.what();
    } catch (const std::exception& e) {
        outcome.reason = SkipReason::OTHER;
        outcome.message = e.what();
    }

    return outcome;
}

void CompositeBuilder::record(const ItemOutcome& outcome, RunSummary& summary) {
    if (outcome.placed) {
        ++summary.placed;
        if (options_.verbose) {
            out_ << "\t- inserted " << outcome.item << " at (" << outcome.position.row << ", "
                 << outcome.position.col << ") pixelsum is " << canvas_.pixel_sum() << "\n";
        }
        if (events_) {
            emitter_.image_placed(run_id_, outcome.item, outcome.position, summary.placed,
                                  *events_);
        }
        return;
    }

    ++summary.skipped;
    ++summary.skips_by_reason[outcome.reason];
    summary.skips.push_back(outcome);

    if (outcome.reason == SkipReason::SHAPE_MISMATCH) {
        err_ << "ERROR: resized image did not fit its cell, skipping " << outcome.item << ": "
             << outcome.message << "\n";
    } else {
        err_ << "Skipping " << outcome.item << " : " << outcome.message << "\n";
    }
    if (events_) {
        emitter_.image_skipped(run_id_, outcome.item, skip_reason_to_string(outcome.reason),
                               outcome.message, *events_);
    }
}

void CompositeBuilder::finalize(RunSummary& summary, io::RasterSink& sink) {
    enter_phase(Phase::FINALIZING);
    out_ << "num_images: " << summary.placed << "\n";

    try {
        sink.write(canvas_.raster());
        summary.output_written = true;
    } catch (const std::exception& e) {
        summary.output_error = e.what();
        err_ << "Cannot write " << sink.describe() << ": " << e.what() << "\n";
    }
    leave_phase(Phase::FINALIZING, summary.output_written ? "ok" : "error",
                {{"output", sink.describe()}});

    phase_ = summary.aborted ? Phase::ABORTED : Phase::DONE;
    summary.final_phase = phase_;

    if (events_) {
        json extra = {{"placed", summary.placed},
                      {"skipped", summary.skipped},
                      {"candidates", summary.candidates},
                      {"aborted", summary.aborted},
                      {"output", sink.describe()}};
        json reasons = json::object();
        for (const auto& [reason, count] : summary.skips_by_reason) {
            reasons[skip_reason_to_string(reason)] = count;
        }
        extra["skips_by_reason"] = reasons;
        if (!summary.output_error.empty()) {
            extra["output_error"] = summary.output_error;
        }
        emitter_.run_end(run_id_, summary.ok(), phase_to_string(phase_), extra, *events_);
    }
}

} // namespace gvpreview::pipeline
