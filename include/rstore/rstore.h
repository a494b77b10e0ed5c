#ifndef RSTORE_H
#define RSTORE_H

#include <rstore/runtime/clock.h>
#include <rstore/runtime/effect.h>
#include <rstore/runtime/hooks.h>
#include <rstore/runtime/pick.h>
#include <rstore/runtime/trace_hooks.h>
#include <rstore/store/container.h>
#include <rstore/store/factory.h>
#include <rstore/store/middleware.h>
#include <rstore/store/store_context.h>
#include <rstore/store/store_instance.h>
#include <rstore/store/store_spec.h>
#include <rstore/types/equality.h>
#include <rstore/types/state.h>
#include <rstore/types/value.h>
#include <rstore/util/emitter.h>
#include <rstore/util/errors.h>
#include <rstore/util/logging.h>

#endif  // RSTORE_H
