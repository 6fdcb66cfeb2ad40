#ifndef GROUPHIERARCHY_H
#define GROUPHIERARCHY_H

#include <QHash>
#include <QRectF>
#include <QSet>
#include <QString>
#include <QVector>
#include <optional>

#include "Constants.h"
#include "geometry/LayerTypes.h"

/**
 * @brief Read-only queries over group layers and their children.
 *
 * Groups reference children by id. The stored links are not trusted to
 * form a tree: every traversal tracks visited ids and stops once it is
 * deeper than maxNestingDepth plus a small slack, treating that as a
 * cycle and returning what it collected so far.
 */
class GroupHierarchy
{
public:
    GroupHierarchy() = delete;

    /**
     * @brief Children of a group in the order of its children list.
     * @param recursive Include descendants of nested groups, depth first
     * @return Empty when the id is unknown or not a group
     */
    static QVector<Layer> getGroupChildren(const QString& groupId, const QVector<Layer>& layers,
                                           bool recursive = false,
                                           int maxNestingDepth = LayerKit::Groups::kMaxNestingDepth);

    // Union of the bounds of all non-group descendants
    static std::optional<QRectF> getGroupBounds(const QString& groupId, const QVector<Layer>& layers,
                                                int maxNestingDepth = LayerKit::Groups::kMaxNestingDepth);

    /**
     * @brief The group that contains a layer.
     *
     * The layer's parentGroup is used when it names an existing group,
     * otherwise the first group listing the layer as a child.
     * @return Pointer into layers, or nullptr for a top-level or unknown layer
     */
    static const Layer* getParentGroup(const QString& layerId, const QVector<Layer>& layers);

    // True when ancestorId is a group somewhere above descendantId
    static bool isDescendantOf(const QString& descendantId, const QString& ancestorId,
                               const QVector<Layer>& layers,
                               int maxNestingDepth = LayerKit::Groups::kMaxNestingDepth);

    // Number of enclosing groups; 0 for top-level and unknown layers
    static int getLayerDepth(const QString& layerId, const QVector<Layer>& layers,
                             int maxNestingDepth = LayerKit::Groups::kMaxNestingDepth);

private:
    using LayerIndex = QHash<QString, const Layer*>;

    static LayerIndex buildIndex(const QVector<Layer>& layers);
    static const Layer* parentOf(const Layer& layer, const LayerIndex& index,
                                 const QVector<Layer>& layers);
    static void collectChildren(const Layer& group, const LayerIndex& index, bool recursive,
                                int depth, int limit, QSet<QString>& visited,
                                QVector<Layer>& result);
    static int traversalLimit(int maxNestingDepth);
};

#endif // GROUPHIERARCHY_H
