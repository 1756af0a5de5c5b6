/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "StackUsageAnalyzer.h"
#include <utility>
#include "ElfImage.h"
#include "analysis/AliasResolver.h"
#include "analysis/StackSizeCorrelator.h"
#include "analysis/StackSizeDecoder.h"
#include "analysis/SymbolTableParser.h"

Functions
StackUsageAnalyzer::analyzeExecutable(const uint8_t* data, size_t size, AnalysisStats* stats) {
    AnalysisStats local_stats;
    ElfImage image(data, size);
    local_stats.machine = image.machine();
    local_stats.littleEndian = image.isLittleEndian();

    SymbolTableScan scan = SymbolTableParser::parse(image);
    local_stats.hasSymbolTable = scan.present;
    local_stats.symbolCount = scan.entryCount;
    local_stats.aliasGroupsAttached = AliasResolver::resolve(scan.defined, scan.aliasCandidates);

    Functions functions;
    functions.addressWidth = scan.addressWidth;
    functions.undefined = std::move(scan.undefined);
    functions.defined = std::move(scan.defined);

    if (auto section = image.findSection(StackSizeDecoder::STACK_SIZES_SECTION)) {
        auto records = StackSizeDecoder::decode(section->bytes, section->size, functions.addressWidth);

        local_stats.hasStackSizes = true;
        local_stats.stackRecordsDecoded = records.size();
        local_stats.stackRecordsMatched = StackSizeCorrelator::correlate(functions.defined, records);
    }

    if (stats) {
        *stats = local_stats;
    }

    return functions;
}
