#include "geometry/GroupHierarchy.h"
#include "geometry/BoundsCalculator.h"

#include <QDebug>

using namespace LayerKit;

QVector<Layer> GroupHierarchy::getGroupChildren(const QString& groupId, const QVector<Layer>& layers,
                                                bool recursive, int maxNestingDepth)
{
    const LayerIndex index = buildIndex(layers);
    const Layer* group = index.value(groupId, nullptr);
    if (!group || group->type != LayerType::Group) {
        return {};
    }

    QSet<QString> visited;
    visited.insert(groupId);
    QVector<Layer> result;
    collectChildren(*group, index, recursive, 1, traversalLimit(maxNestingDepth), visited, result);
    return result;
}

std::optional<QRectF> GroupHierarchy::getGroupBounds(const QString& groupId, const QVector<Layer>& layers,
                                                     int maxNestingDepth)
{
    const QVector<Layer> descendants = getGroupChildren(groupId, layers, true, maxNestingDepth);

    QVector<std::optional<QRectF>> boundsList;
    boundsList.reserve(descendants.size());
    for (const Layer& layer : descendants) {
        if (layer.type != LayerType::Group) {
            boundsList.append(BoundsCalculator::getLayerBounds(layer));
        }
    }
    return BoundsCalculator::mergeBounds(boundsList);
}

const Layer* GroupHierarchy::getParentGroup(const QString& layerId, const QVector<Layer>& layers)
{
    const LayerIndex index = buildIndex(layers);
    const Layer* layer = index.value(layerId, nullptr);
    if (!layer) {
        return nullptr;
    }
    return parentOf(*layer, index, layers);
}

bool GroupHierarchy::isDescendantOf(const QString& descendantId, const QString& ancestorId,
                                    const QVector<Layer>& layers, int maxNestingDepth)
{
    if (descendantId == ancestorId) {
        return false;
    }

    const LayerIndex index = buildIndex(layers);
    const Layer* current = index.value(descendantId, nullptr);
    if (!current) {
        return false;
    }

    const int limit = traversalLimit(maxNestingDepth);
    QSet<QString> visited;
    visited.insert(descendantId);
    for (int depth = 1; depth <= limit; ++depth) {
        const Layer* parent = parentOf(*current, index, layers);
        if (!parent) {
            return false;
        }
        if (parent->id == ancestorId) {
            return true;
        }
        if (visited.contains(parent->id)) {
            qWarning() << "GroupHierarchy: cycle detected above" << descendantId;
            return false;
        }
        visited.insert(parent->id);
        current = parent;
    }

    qWarning() << "GroupHierarchy: max nesting depth exceeded above" << descendantId;
    return false;
}

int GroupHierarchy::getLayerDepth(const QString& layerId, const QVector<Layer>& layers,
                                  int maxNestingDepth)
{
    const LayerIndex index = buildIndex(layers);
    const Layer* current = index.value(layerId, nullptr);
    if (!current) {
        return 0;
    }

    const int limit = traversalLimit(maxNestingDepth);
    QSet<QString> visited;
    visited.insert(layerId);
    int depth = 0;
    while (const Layer* parent = parentOf(*current, index, layers)) {
        if (visited.contains(parent->id)) {
            qWarning() << "GroupHierarchy: cycle detected above" << layerId;
            break;
        }
        if (depth >= limit) {
            qWarning() << "GroupHierarchy: max nesting depth exceeded above" << layerId;
            break;
        }
        visited.insert(parent->id);
        ++depth;
        current = parent;
    }
    return depth;
}

GroupHierarchy::LayerIndex GroupHierarchy::buildIndex(const QVector<Layer>& layers)
{
    LayerIndex index;
    index.reserve(layers.size());
    for (const Layer& layer : layers) {
        // First occurrence wins on duplicate ids
        if (!index.contains(layer.id)) {
            index.insert(layer.id, &layer);
        }
    }
    return index;
}

const Layer* GroupHierarchy::parentOf(const Layer& layer, const LayerIndex& index,
                                      const QVector<Layer>& layers)
{
    if (!layer.parentGroup.isEmpty()) {
        const Layer* parent = index.value(layer.parentGroup, nullptr);
        if (parent && parent->type == LayerType::Group && parent != &layer) {
            return parent;
        }
    }

    for (const Layer& candidate : layers) {
        if (candidate.type == LayerType::Group && &candidate != &layer &&
            candidate.children.contains(layer.id)) {
            return &candidate;
        }
    }
    return nullptr;
}

void GroupHierarchy::collectChildren(const Layer& group, const LayerIndex& index, bool recursive,
                                     int depth, int limit, QSet<QString>& visited,
                                     QVector<Layer>& result)
{
    if (depth > limit) {
        qWarning() << "GroupHierarchy: max nesting depth exceeded for" << group.id;
        return;
    }

    for (const QString& childId : group.children) {
        const Layer* child = index.value(childId, nullptr);
        if (!child) {
            continue;
        }
        if (visited.contains(childId)) {
            qWarning() << "GroupHierarchy: cycle detected at" << childId << "in" << group.id;
            continue;
        }
        visited.insert(childId);
        result.append(*child);

        if (recursive && child->type == LayerType::Group) {
            collectChildren(*child, index, recursive, depth + 1, limit, visited, result);
        }
    }
}

int GroupHierarchy::traversalLimit(int maxNestingDepth)
{
    return qMax(0, maxNestingDepth) + Groups::kTraversalSlack;
}
