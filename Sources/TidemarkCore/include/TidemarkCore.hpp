#pragma once

// TidemarkCore - offline-first push/pull synchronization over SQLite
//
// Usage:
//   #include <TidemarkCore.hpp>
//
//   tidemark::database db("app.db");
//   auto config = tidemark::sync_config::from_file("sync.json");
//   config.apply_environment();
//
//   tidemark::sync_engine engine(db, my_http_client, my_session_provider, config);
//   engine.set_on_progress([](const tidemark::sync_progress_event& e) {
//       std::cout << e.to_json().dump() << std::endl;
//   });
//
//   tidemark::sync_manager manager(engine);
//   auto result = manager.run_once();   // or manager.start_auto(5 * 60 * 1000)

#include "tidemark/types.hpp"
#include "tidemark/log.hpp"
#include "tidemark/db.hpp"
#include "tidemark/schema.hpp"
#include "tidemark/settings.hpp"
#include "tidemark/scheduler.hpp"
#include "tidemark/network.hpp"
#include "tidemark/auth.hpp"
#include "tidemark/crypto.hpp"
#include "tidemark/config.hpp"
#include "tidemark/local_store.hpp"
#include "tidemark/schema_reconciler.hpp"
#include "tidemark/pending_collector.hpp"
#include "tidemark/push_transmitter.hpp"
#include "tidemark/pull_applier.hpp"
#include "tidemark/ledger.hpp"
#include "tidemark/diagnostics.hpp"
#include "tidemark/sync.hpp"
#include "tidemark/sync_manager.hpp"
