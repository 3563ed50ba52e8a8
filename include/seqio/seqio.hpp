#pragma once

#include "seqio/common.hpp"

#include "seqio/any_stream.hpp"
#include "seqio/memory_stream.hpp"
#include "seqio/span_stream.hpp"

#include "seqio/reader.hpp"
#include "seqio/writer.hpp"
