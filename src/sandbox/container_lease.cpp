#include "container_lease.h"
#include "core/log_manager.h"

ContainerLease::ContainerLease(std::unique_ptr<IContainerRuntime> runtime)
    : m_runtime(std::move(runtime))
{
}

ContainerLease::~ContainerLease()
{
    release();
}

void ContainerLease::release()
{
    if (m_released)
        return;
    m_released = true;

    if (!m_runtime)
        return;

    if (!m_containerId.isEmpty()) {
        if (m_started) {
            auto stopped = m_runtime->stopContainer(m_containerId);
            if (!stopped)
                LOG_WARNING(QStringLiteral("ContainerLease: stop %1 failed: %2")
                    .arg(m_containerId.left(12), stopped.error().describe()));
        }

        auto removed = m_runtime->removeContainer(m_containerId);
        if (!removed)
            LOG_WARNING(QStringLiteral("ContainerLease: remove %1 failed: %2")
                .arg(m_containerId.left(12), removed.error().describe()));
        else
            LOG_DEBUG(QStringLiteral("ContainerLease: removed %1").arg(m_containerId.left(12)));
    }

    m_runtime->close();
}
