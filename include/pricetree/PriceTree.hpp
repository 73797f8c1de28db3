#pragma once
#include "aggregate/IndexAggregator.hpp"
#include "aggregate/IndexFormula.hpp"
#include "build/TreeBuilder.hpp"
#include "code/CategoryCode.hpp"
#include "config/LoadOptions.hpp"
#include "core/Category.hpp"
#include "core/Error.hpp"
#include "core/Period.hpp"
#include "export/TreeJsonExporter.hpp"
#include "ingest/CsvReader.hpp"
#include "ingest/FlatRecord.hpp"
#include "ingest/NumberParsing.hpp"
#include "ingest/RecordMapper.hpp"
#include "log/TaggedLogger.hpp"
#include "rebalance/WeightRebalancer.hpp"
#include "report/PriceReport.hpp"
#include "session/EditSession.hpp"
#include "snapshot/TreeStats.hpp"
#include "view/TreeView.hpp"
