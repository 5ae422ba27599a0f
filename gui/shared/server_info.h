#ifndef LOOKOUT_SERVER_INFO_H
#define LOOKOUT_SERVER_INFO_H

#include <QString>
#include <QStringList>
#include <optional>
#include "common.h"
#include "preview_types.h"
#include "type_inferrer.h"

namespace LookoutCommon {

/**
 * Everything the headless scanner prints about one detection run
 */
struct DetectionReport {
    QString projectRoot;
    bool projectRootExists = false;
    std::optional<TypeInference> inference;
    bool quick = false;
    DetectionResult result;                 // full scan
    std::optional<DevServer> quickHit;      // quick detect
    QString logPath;
};

/**
 * Generate the framed human readable report
 * @param report Detection run to describe
 * @param verbose If true, also lists every scanned port and latency details
 * @return Formatted string ready to be printed with a single cout/logger call
 */
QString generateDetectionReport(const DetectionReport& report, bool verbose = false);

// One line per server: label, URL and the HMR marker
QString formatServerLine(const DevServer& server);

// Compact JSON for --json: the DetectionResult, or the quick hit / null
QString generateJsonReport(const DetectionReport& report);

// Sorted "type:port" identities, used to notice changes between watch rescans
QStringList serverIdentities(const DetectionResult& result);

} // namespace LookoutCommon

#endif // LOOKOUT_SERVER_INFO_H
