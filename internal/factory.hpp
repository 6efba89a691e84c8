#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/coordination/work_queue.hpp"
#include "internal/db/api/sorted_store.hpp"
#include "internal/pipeline/status_maker.hpp"
#include "internal/pipeline/status_recorder.hpp"
#include "internal/pipeline/work_assigner.hpp"
#include "internal/pipeline/work_maker.hpp"

namespace replication::factory {

struct CycleStats {
  pipeline::StatusMakerStats  status;
  pipeline::WorkMakerStats    work;
  pipeline::WorkAssignerStats assignment;
};

/*
  Application

  Owns every long-lived component. The periodic scheduler that drives
  RunCycle() lives outside this library.
*/
struct Application {
  std::shared_ptr<db::SortedStore>                    store;
  std::shared_ptr<coordination::DistributedWorkQueue> work_queue;

  std::shared_ptr<pipeline::StatusRecorder> status_recorder;
  std::shared_ptr<pipeline::StatusMaker>    status_maker;
  std::shared_ptr<pipeline::WorkMaker>      work_maker;
  std::shared_ptr<pipeline::WorkAssigner>   work_assigner;

  // StatusMaker, WorkMaker and the assigner, once each and in that order.
  CycleStats RunCycle();
};

/*
  Build

  Composition root: the ONLY place that knows the concrete store, queue
  and strategy types. Creates the metadata table if needed and attaches
  its combiner.
*/
Application Build(const replication::runtime::config::RuntimeConfig& config);

// Build() with a caller-supplied queue, for a coordination service wired elsewhere.
Application Build(const replication::runtime::config::RuntimeConfig& config, std::shared_ptr<coordination::DistributedWorkQueue> work_queue);

} // namespace replication::factory
