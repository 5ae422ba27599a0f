#include "server_info.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <QTextStream>

namespace LookoutCommon {

QString formatServerLine(const DevServer& server) {
    QString line = QString("  %1 %2")
        .arg(serverTypeLabel(server.type), -12)
        .arg(server.previewUrl());
    if (server.hmr) {
        line += "  [HMR]";
    }
    return line;
}

QStringList serverIdentities(const DetectionResult& result) {
    QStringList identities;
    for (const auto& server : result.servers) {
        identities << QString("%1:%2").arg(serverTypeId(server.type)).arg(server.port);
    }
    identities.sort();
    return identities;
}

QString generateDetectionReport(const DetectionReport& report, bool verbose) {
    QString text;
    QTextStream stream(&text);

    stream << "\n";
    stream << "========================================================\n";
    stream << (report.quick ? "Lookout Quick Detect" : "Lookout Dev Server Scan") << "\n";
    stream << "--------------------------------------------------------\n";

    stream << "  Project:   " << report.projectRoot;
    if (!report.projectRootExists) {
        stream << " (not found)";
    }
    stream << "\n";

    if (report.inference) {
        stream << "  Family:    " << serverTypeLabel(report.inference->type)
               << " (" << report.inference->markerFile << ")\n";
    } else {
        stream << "  Family:    unknown (from response headers)\n";
    }

    if (report.quick) {
        if (report.quickHit) {
            stream << "  Server:\n" << formatServerLine(*report.quickHit) << "\n";
        } else {
            stream << "  Server:    no dev server detected\n";
        }
    } else {
        if (report.result.servers.isEmpty()) {
            stream << "  Servers:   no dev server detected\n";
        } else {
            stream << "  Servers:\n";
            for (const auto& server : report.result.servers) {
                stream << formatServerLine(server) << "\n";
            }
        }
        stream << "  Scanned:   " << report.result.scannedPorts.size() << " port(s) in "
               << report.result.durationMs << "ms\n";

        if (verbose) {
            QStringList ports;
            for (quint16 port : report.result.scannedPorts) {
                ports << QString::number(port);
            }
            stream << "  Ports:     " << ports.join(", ") << "\n";
        }
    }

    if (!report.logPath.isEmpty()) {
        stream << "  Logs:      " << report.logPath << "\n";
    }

    stream << "========================================================\n";

    stream.flush();
    return text;
}

QString generateJsonReport(const DetectionReport& report) {
    QJsonDocument doc;
    if (report.quick) {
        if (!report.quickHit) {
            return QStringLiteral("null");
        }
        doc = QJsonDocument(report.quickHit->toJson());
    } else {
        doc = QJsonDocument(report.result.toJson());
    }
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

} // namespace LookoutCommon
