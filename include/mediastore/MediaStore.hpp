#pragma once

#include <mediastore/cli/CommandLine.hpp>
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/log/TaggedLogger.hpp>
#include <mediastore/media/MediaElement.hpp>
#include <mediastore/media/MediaFeatures.hpp>
#include <mediastore/runtime/EventLoop.hpp>
#include <mediastore/serialization/StateJson.hpp>
#include <mediastore/state/Computed.hpp>
#include <mediastore/state/ReactiveState.hpp>
#include <mediastore/store/Feature.hpp>
#include <mediastore/store/Guard.hpp>
#include <mediastore/store/Request.hpp>
#include <mediastore/store/Store.hpp>
#include <mediastore/store/StoreBase.hpp>
#include <mediastore/store/StoreConfig.hpp>
#include <mediastore/task/AbortSignal.hpp>
#include <mediastore/task/Future.hpp>
#include <mediastore/task/Queue.hpp>
#include <mediastore/task/Scheduler.hpp>
#include <mediastore/task/TaskInfo.hpp>
