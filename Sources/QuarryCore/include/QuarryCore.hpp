#pragma once

#ifdef __cplusplus

#include "quarry/log.hpp"
#include "quarry/errors.hpp"
#include "quarry/types.hpp"
#include "quarry/type_registry.hpp"
#include "quarry/invoker.hpp"
#include "quarry/property_namer.hpp"
#include "quarry/property_metadata.hpp"
#include "quarry/metadata_registry.hpp"
#include "quarry/meta_object.hpp"
#include "quarry/cache_key.hpp"
#include "quarry/local_cache.hpp"
#include "quarry/deferred_load.hpp"
#include "quarry/statement.hpp"
#include "quarry/transaction.hpp"
#include "quarry/statement_runner.hpp"
#include "quarry/executor.hpp"
#include "quarry/db.hpp"
#include "quarry/sqlite_transaction.hpp"
#include "quarry/sqlite_runner.hpp"
#include "quarry/configuration.hpp"
#include "quarry/session.hpp"

#endif // __cplusplus
