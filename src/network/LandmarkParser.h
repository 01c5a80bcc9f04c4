#pragma once
#include <QByteArray>
#include <QString>
#include <QVector>

#include "../common/Types.h"

namespace LandmarkParser
{
    /**
     * Decodes one feed line:
     *   {"hands":[{"handedness":"Right","score":0.97,
     *              "landmarks":[{"x":0.5,"y":0.5,"z":0.0}, ...]}]}
     *
     * Landmark counts are not checked here; the router drops bad hands.
 * A hand with any point that is not an object with numeric x and y
 * (z optional) comes back with no landmarks.
     * Returns false (and leaves hands untouched) when the line is not a
     * JSON object.
     */
    bool parseFrame(const QByteArray &line, QVector<HandInfo> &hands, QString *error = nullptr);
}
