#ifndef LOOKOUT_QT_MESSAGE_HANDLER_H
#define LOOKOUT_QT_MESSAGE_HANDLER_H

#include <QtGlobal>

namespace LookoutCommon {
    /**
     * Route qDebug/qWarning/qCritical output through LookoutLogger.
     * Console messages raised by pages inside the preview arrive under the
     * "js" category and are tagged [JS]; everything else is tagged [Qt].
     * Messages logged before the logger exists go to the previous handler only.
     */
    void installQtMessageHandler();
}

#endif // LOOKOUT_QT_MESSAGE_HANDLER_H
