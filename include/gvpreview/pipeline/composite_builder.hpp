#pragma once

#include "gvpreview/composite/composite_canvas.hpp"
#include "gvpreview/config/configuration.hpp"
#include "gvpreview/core/events.hpp"
#include "gvpreview/core/types.hpp"
#include "gvpreview/io/image_io.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace gvpreview::pipeline {

enum class SkipReason {
    PARSE,
    FORMAT_MISMATCH,
    INDEX_OUT_OF_RANGE,
    UNSUPPORTED_ORDER,
    DECODE,
    SHAPE_MISMATCH,
    OTHER
};

std::string skip_reason_to_string(SkipReason reason);

// Result of pushing one file through parse, map, decode, resize and paste.
struct ItemOutcome {
    std::string item;
    bool placed = false;
    GridPosition position;
    SkipReason reason = SkipReason::OTHER;
    std::string message;
};

struct RunSummary {
    std::string run_id;
    int candidates = 0;
    int placed = 0;
    int skipped = 0;
    std::map<SkipReason, int> skips_by_reason;
    std::vector<ItemOutcome> skips;
    bool aborted = false;
    std::string setup_error;   // enumeration failed; nothing was pasted
    bool output_written = false;
    std::string output_error;
    Phase final_phase = Phase::INIT;

    bool ok() const { return setup_error.empty() && output_written; }
};

struct CompositeOptions {
    GridDims grid;
    CellSize cell{200, 300};
    FillOrder order = FillOrder::COLS_RIGHT;
    ImageFormat format = ImageFormat::JPG;
    bool verbose = false;

    static CompositeOptions from_config(const config::Config& cfg);
};

// Assembles one composite per run. Every item failure is isolated into an
// ItemOutcome; the canvas is handed to the sink exactly once per run, also
// when the stop flag cut the run short or nothing could be placed.
class CompositeBuilder {
public:
    // Called after every item, placed or skipped, with the running summary.
    using ItemCallback = std::function<void(const ItemOutcome&, const RunSummary&)>;
    using ImageLoader = std::function<SourceImage(const fs::path&, const FilenameMetadata&)>;

    CompositeBuilder(CompositeOptions options, std::ostream& out, std::ostream& err,
                     std::ostream* events = nullptr);

    // Enumerate input (directory or archive) and composite every candidate.
    RunSummary run(const fs::path& input, io::RasterSink& sink,
                   const std::atomic<bool>* stop_flag = nullptr);

    // Composite an already enumerated list of files.
    RunSummary run_files(const std::vector<fs::path>& files, io::RasterSink& sink,
                         const std::atomic<bool>* stop_flag = nullptr);

    ItemOutcome process_item(const fs::path& file, const std::string& display_name);

    void set_item_callback(ItemCallback cb) { on_item_ = std::move(cb); }
    // Replaces io::load_source_image for decoding.
    void set_image_loader(ImageLoader loader) { loader_ = std::move(loader); }

    const composite::CompositeCanvas& canvas() const { return canvas_; }
    const CompositeOptions& options() const { return options_; }
    const std::string& run_id() const { return run_id_; }
    Phase phase() const { return phase_; }

private:
    struct Item {
        fs::path file;
        std::string name;
    };

    void begin_run(RunSummary& summary, const std::string& input_label);
    void composite_items(const std::vector<Item>& items, RunSummary& summary,
                         const std::atomic<bool>* stop_flag);
    void record(const ItemOutcome& outcome, RunSummary& summary);
    void finalize(RunSummary& summary, io::RasterSink& sink);

    void enter_phase(Phase phase);
    void leave_phase(Phase phase, const std::string& status, const core::json& extra = {});

    CompositeOptions options_;
    std::ostream& out_;
    std::ostream& err_;
    std::ostream* events_;
    core::EventEmitter emitter_;
    std::string run_id_;
    Phase phase_ = Phase::INIT;
    composite::CompositeCanvas canvas_;
    ItemCallback on_item_;
    ImageLoader loader_;
};

} // namespace gvpreview::pipeline
