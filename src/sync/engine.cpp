#include "tsync/sync/engine.hpp"

#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>
#include <vector>

namespace tsync::sync {

namespace {

bool is_connection_failure(const Error& error) {
    return error.kind == ErrorKind::Connection || error.kind == ErrorKind::Timeout;
}

/// Listing errors are either about reaching the endpoint or about the tree itself.
Error classify_listing_error(const Error& error, const char* role) {
    const std::string message = std::string("cannot list ") + role + ": " + error.message;
    if (is_connection_failure(error)) {
        return Error{ErrorKind::Connection, message};
    }
    return Error{ErrorKind::Planning, message};
}

void attach_checksums(transport::TransportClient& source,
                      transport::TransportClient& target,
                      std::vector<FileEntry>& source_entries,
                      std::vector<FileEntry>& target_entries) {
    std::map<std::string, FileEntry*> target_files;
    for (auto& entry : target_entries) {
        if (entry.is_file()) {
            target_files.emplace(entry.path, &entry);
        }
    }

    for (auto& entry : source_entries) {
        if (!entry.is_file()) {
            continue;
        }
        auto it = target_files.find(entry.path);
        // Different sizes already differ; no need to read either side
        if (it == target_files.end() || it->second->size != entry.size) {
            continue;
        }
        auto source_sum = source.checksum(entry.path);
        auto target_sum = target.checksum(entry.path);
        if (source_sum.is_error() || target_sum.is_error()) {
            spdlog::warn("Checksum unavailable for {}, comparing size and time",
                         entry.path);
            continue;
        }
        entry.checksum = source_sum.value();
        it->second->checksum = target_sum.value();
    }
}

} // namespace

SyncEngine::SyncEngine(CheckpointStore& checkpoints,
                       const events::EventBus* bus,
                       EngineSettings settings,
                       TransportFactory factory)
    : checkpoints_(checkpoints), bus_(bus), settings_(std::move(settings)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const Endpoint& endpoint, const transport::TransportOptions& options) {
            return transport::make_transport(endpoint, options);
        };
    }
}

Result<std::unique_ptr<transport::TransportClient>> SyncEngine::open(const Endpoint& endpoint, const char* role) {
    auto client = factory_(endpoint, settings_.transport);
    if (!client) {
        return Err<std::unique_ptr<transport::TransportClient>>(
            ErrorKind::InvalidArgument, std::string("no transport for ") + role + " " + endpoint.describe());
    }
    if (auto connected = client->connect(); connected.is_error()) {
        return Err<std::unique_ptr<transport::TransportClient>>(
            ErrorKind::Connection,
            std::string("cannot connect to ") + role + " " + endpoint.describe() + ": " + connected.error().message);
    }
    return Ok(std::move(client));
}

Result<SyncEngine::Session> SyncEngine::prepare(const SyncTask& task) {
    auto source = open(task.source, "source");
    if (source.is_error()) {
        return Err<Session>(source.error());
    }
    auto target = open(task.target, "target");
    if (target.is_error()) {
        return Err<Session>(target.error());
    }

    auto source_listing = source.value()->list();
    if (source_listing.is_error()) {
        return Err<Session>(classify_listing_error(source_listing.error(), "source"));
    }

    std::vector<FileEntry> target_entries;
    auto target_listing = target.value()->list();
    if (target_listing.is_ok()) {
        target_entries = std::move(target_listing.value());
    } else if (target_listing.error().kind == ErrorKind::NotFound) {
        spdlog::info("Target {} does not exist yet, treating it as empty", task.target.describe());
    } else {
        return Err<Session>(classify_listing_error(target_listing.error(), "target"));
    }

    std::vector<FileEntry> source_entries = std::move(source_listing.value());
    if (task.compare == CompareMethod::Checksum) {
        attach_checksums(*source.value(), *target.value(), source_entries, target_entries);
    }

    DiffPlanner planner(PlanOptions{task.mode, task.compare, task.filters});
    auto plan = planner.plan(source_entries, target_entries);
    if (plan.is_error()) {
        return Err<Session>(plan.error());
    }

    Session session;
    session.source = std::move(source.value());
    session.target = std::move(target.value());
    session.plan = std::move(plan.value());
    return Ok(std::move(session));
}

Result<DiffPlan> SyncEngine::plan(const SyncTask& task) {
    auto session = prepare(task);
    if (session.is_error()) {
        return Err<DiffPlan>(session.error());
    }
    session.value().source->disconnect();
    session.value().target->disconnect();
    return Ok(std::move(session.value().plan));
}

SyncResult SyncEngine::run(const std::string& task_id, const SyncTask& task, const CancellationToken& cancel) {
    const TimePoint started = Clock::now();
    events::publish(bus_, events::SyncStartedEvent{task_id, task.source.describe(), task.target.describe(), task.mode});

    SyncResult result;
    auto session = prepare(task);
    if (session.is_error()) {
        const Error& error = session.error();
        result.outcome = is_connection_failure(error) ? SyncOutcome::ConnectionFailed : SyncOutcome::PlanningFailed;
        result.error = error;
        result.message = result.summary();
        spdlog::error("Sync {} aborted before transfer: {}", task_id, error.describe());
    } else {
        Session& active = session.value();
        const DiffPlan& plan = active.plan;
        events::publish(bus_, events::SyncPlannedEvent{
            task_id,
            plan.count(OperationKind::Copy),
            plan.count(OperationKind::Update),
            plan.count(OperationKind::Delete),
            plan.count(OperationKind::Skip),
            plan.planned_bytes()});

        TransferOptions options;
        options.task_id = task_id;
        options.max_workers = task.worker_count();
        options.chunk_size = settings_.chunk_size;
        options.preserve_modified_time = settings_.preserve_modified_time;

        TransferExecutor executor(*active.source, *active.target, checkpoints_, bus_);
        result = executor.apply(plan, options, cancel);

        active.source->disconnect();
        active.target->disconnect();
    }

    result.started = started;
    result.finished = Clock::now();
    result.source_description = task.source.describe();
    result.target_description = task.target.describe();
    result.mode = task.mode;

    events::publish(bus_, events::SyncFinishedEvent{task_id, result.outcome, result.message});
    return result;
}

} // namespace tsync::sync
