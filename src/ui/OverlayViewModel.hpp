#pragma once

#include <QObject>
#include <QString>
#include "core/overlay/IOverlayRenderer.hpp"

namespace dsc {

/// Status overlay exposed to a QML or Widgets front end.
class OverlayViewModel : public QObject, public IOverlayRenderer {
    Q_OBJECT

    Q_PROPERTY(QString state READ state NOTIFY changed)
    Q_PROPERTY(QString title READ title NOTIFY changed)
    Q_PROPERTY(QString detail READ detail NOTIFY changed)
    Q_PROPERTY(bool visible READ isVisible NOTIFY visibleChanged)

public:
    explicit OverlayViewModel(QObject *parent = nullptr);

    void render(const OverlayParams& params) override;
    void hide() override;
    void raise() override;

    QString state() const { return state_; }
    QString title() const { return title_; }
    QString detail() const { return detail_; }
    bool isVisible() const { return visible_; }

    static QString titleFor(const OverlayParams& params);
    static QString detailFor(const OverlayParams& params);

signals:
    void changed();
    void visibleChanged();
    void raiseRequested();

private:
    void setVisible(bool visible);

    QString state_ = QStringLiteral("None");
    QString title_;
    QString detail_;
    bool visible_ = false;
};

} // namespace dsc
