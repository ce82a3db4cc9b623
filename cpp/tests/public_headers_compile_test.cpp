#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "podkit/bytes/borrow.hpp"
#include "podkit/bytes/buffer.hpp"
#include "podkit/bytes/byte_view.hpp"
#include "podkit/bytes/pod.hpp"
#include "podkit/bytes/pod_cast.hpp"
#include "podkit/cli/commands.hpp"
#include "podkit/cli/inspect.hpp"
#include "podkit/cli/options.hpp"
#include "podkit/collections/avl_tree.hpp"
#include "podkit/collections/flex_map.hpp"
#include "podkit/collections/flex_seq.hpp"
#include "podkit/collections/flex_set.hpp"
#include "podkit/collections/layout.hpp"
#include "podkit/collections/region.hpp"
#include "podkit/collections/sorted.hpp"
#include "podkit/core/errors.hpp"
#include "podkit/core/types.hpp"
#include "podkit/types/bool.hpp"
#include "podkit/types/maybe_null.hpp"
#include "podkit/types/pod_int.hpp"
#include "podkit/types/prefix_str.hpp"
#include "podkit/types/str.hpp"
#include "podkit/types/utf8.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
