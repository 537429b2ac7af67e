#pragma once
#include "softmock/core/flow/FlowDispatcher.h"
#include <string>
#include <mutex>
#include <fstream>
#include <memory>
#include <optional>

namespace softmock::core::flow {
class FlowStore;

// Appends every store change to an NDJSON journal: one "put" line with the
// whole flow per insert/edit, one "del" line per removal. Each line carries
// the flow's version since lines may arrive out of commit order.
class FlowFileStore : public FlowObserver, public std::enable_shared_from_this<FlowFileStore> {
public:
    explicit FlowFileStore(std::string path);
    bool is_open() const { return ofs.is_open(); }
    const std::string& path() const { return path_; }
    void on_flow(FlowEvent event, const Flow& flow) override;
private:
    std::string path_;
    std::mutex mu;
    std::ofstream ofs;
};

std::string flow_to_json_line(const Flow& flow);
// nullopt for lines that are not a well-formed "put" record.
std::optional<Flow> flow_from_json_line(const std::string& line);

// Replays the journal at `path` into `store` (highest version per id wins,
// deletions honoured). Malformed lines are logged and skipped. Returns the
// number of flows restored; a missing file restores nothing.
std::size_t load_flows(const std::string& path, FlowStore& store);

std::shared_ptr<FlowFileStore> make_flow_file_store(FlowDispatcher& d, const std::string& path);
}
