#pragma once
#include "semantic/ports.h"
#include <memory>

// Owns the runtime connection and the container created through it for the
// duration of one execution. Teardown (stop if started, remove if created,
// close the connection) runs exactly once, either explicitly or from the
// destructor. Teardown failures are logged, never raised.
class ContainerLease {
public:
    explicit ContainerLease(std::unique_ptr<IContainerRuntime> runtime);
    ~ContainerLease();

    ContainerLease(const ContainerLease&) = delete;
    ContainerLease& operator=(const ContainerLease&) = delete;

    IContainerRuntime* runtime() const { return m_runtime.get(); }

    void setContainer(const QString& containerId) { m_containerId = containerId; }
    void markStarted() { m_started = true; }

    QString containerId() const { return m_containerId; }
    bool started() const { return m_started; }
    bool released() const { return m_released; }

    void release();

private:
    std::unique_ptr<IContainerRuntime> m_runtime;
    QString m_containerId;
    bool m_started = false;
    bool m_released = false;
};
