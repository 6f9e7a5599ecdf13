// metadoc/index/schema.hpp - Generated message types used across the pipeline
//
//   semanticdb::  input documents (semanticdb3.proto)
//   schema::      persisted records (metadoc.proto)
//
#pragma once

#include "metadoc.pb.h"
#include "semanticdb3.pb.h"

namespace metadoc
{

namespace semanticdb = ::scala::meta::internal::semanticdb3;

}  // namespace metadoc
