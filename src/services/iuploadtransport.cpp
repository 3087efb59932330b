/**
 * @file iuploadtransport.cpp
 * @brief Shared helpers for IUploadTransport implementations.
 *
 * This file also gives Qt's MOC a translation unit for the interface's
 * signals.
 */

#include "iuploadtransport.h"

#include <QtMath>

int IUploadTransport::progressPercent(qint64 sent, qint64 total)
{
    if (total <= 0) {
        return 0;
    }
    return qRound(static_cast<double>(sent) * 100.0 / static_cast<double>(total));
}

bool IUploadTransport::isSuccessCode(int status)
{
    return (status >= 200 && status < 300) || status == 304;
}
