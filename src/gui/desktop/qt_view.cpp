#include "qt_view.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QKeyEvent>
#include <QMainWindow>
#include <QMouseEvent>
#include <QPainter>
#include <QWidget>

#include <cstring>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

struct Zone {
    int x, y, w, h;
    std::string name;
};

// Копия данных зоны: текст и шары живут дольше вызова draw_element
struct ZoneContent {
    ElementType_t type = ELEMENT_TEXT;
    std::string text;
    int number = 0;
    std::vector<BallSprite_t> balls;
    double arenaWidth = 0.0;
    double arenaHeight = 0.0;
};

static QColor colorForVisual(BallVisual_t visual) {
    switch (visual) {
    case BALL_HIGHLIGHTED: return QColor(255, 191, 0);   // amber
    case BALL_CORRECT:     return QColor(46, 204, 64);
    case BALL_INCORRECT:   return QColor(230, 57, 70);
    case BALL_NEUTRAL:
    default:               return QColor(66, 135, 245);
    }
}

static QRect zoneRect(const Zone &z) {
    return QRect(z.x * VIEW_QT_CELL_W, z.y * VIEW_QT_CELL_H,
                 z.w * VIEW_QT_CELL_W, z.h * VIEW_QT_CELL_H);
}

class GameWidget : public QWidget {
public:
    explicit GameWidget(QWidget *parent = nullptr)
        : QWidget(parent)
    {
        setFocusPolicy(Qt::StrongFocus);
    }

    void setElementData(const std::string &id, const ElementData_t &data) {
        ZoneContent &c = elements_[id];
        c.type = data.type;
        switch (data.type) {
        case ELEMENT_TEXT:
            c.text = data.content.text;
            break;
        case ELEMENT_NUMBER:
            c.number = data.content.number;
            break;
        case ELEMENT_BALLS:
            c.balls.assign(data.content.balls.data,
                           data.content.balls.data + data.content.balls.count);
            c.arenaWidth = data.content.balls.arena_width;
            c.arenaHeight = data.content.balls.arena_height;
            break;
        }
    }

    void setZone(const Zone &zone) {
        for (Zone &z : zones_) {
            if (z.name == zone.name) {
                z = zone;
                return;
            }
        }
        zones_.push_back(zone);
    }

    bool hasZone(const std::string &id) const {
        for (const Zone &z : zones_)
            if (z.name == id) return true;
        return false;
    }

    void pushKey(int key_code) {
        InputEvent_t ev{};
        ev.kind = INPUT_KEY;
        ev.key_code = key_code;
        inputQueue_.push(ev);
    }

    // Очередь событий ввода для poll_input()
    bool popInput(InputEvent_t &out) {
        if (inputQueue_.empty())
            return false;
        out = inputQueue_.front();
        inputQueue_.pop();
        return true;
    }

protected:
    void paintEvent(QPaintEvent *) override {
        QPainter p(this);
        p.setRenderHint(QPainter::Antialiasing);
        p.fillRect(rect(), Qt::black);

        for (const Zone &z : zones_) {
            QRect rect = zoneRect(z);

            auto it = elements_.find(z.name);
            if (it == elements_.end())
                continue;

            const ZoneContent &c = it->second;

            switch (c.type) {
            case ELEMENT_TEXT:
                p.setPen(Qt::white);
                p.drawText(rect.adjusted(4, 4, -4, -4),
                           Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap,
                           QString::fromUtf8(c.text.c_str()));
                break;
            case ELEMENT_NUMBER:
                p.setPen(Qt::white);
                p.drawText(rect, Qt::AlignCenter, QString::number(c.number));
                break;
            case ELEMENT_BALLS: {
                p.setPen(Qt::gray);
                p.drawRect(rect);
                if (c.arenaWidth <= 0.0 || c.arenaHeight <= 0.0)
                    break;

                const double sx = rect.width() / c.arenaWidth;
                const double sy = rect.height() / c.arenaHeight;
                p.setPen(Qt::NoPen);
                for (const BallSprite_t &b : c.balls) {
                    p.setBrush(colorForVisual(b.visual));
                    p.drawEllipse(QPointF(rect.x() + b.x * sx, rect.y() + b.y * sy),
                                  b.radius * sx, b.radius * sy);
                }
                p.setBrush(Qt::NoBrush);
                break;
            }
            }
        }
    }

    void keyPressEvent(QKeyEvent *event) override {
        InputEvent_t ev{};
        ev.kind = INPUT_KEY;

        switch (event->key()) {
        case Qt::Key_Return:
        case Qt::Key_Enter:  ev.key_code = VIEW_KEY_ENTER; break;
        case Qt::Key_Escape: ev.key_code = VIEW_KEY_ESCAPE; break;
        case Qt::Key_Space:  ev.key_code = VIEW_KEY_SPACE; break;
        default:
            ev.key_code = event->text().isEmpty()
                              ? 0
                              : event->text().at(0).toLatin1();
            break;
        }

        if (ev.key_code != 0)
            inputQueue_.push(ev);

        QWidget::keyPressEvent(event);
    }

    void mousePressEvent(QMouseEvent *event) override {
        if (event->button() != Qt::LeftButton) {
            QWidget::mousePressEvent(event);
            return;
        }

        const QPointF pos = event->position();
        for (const Zone &z : zones_) {
            auto it = elements_.find(z.name);
            if (it == elements_.end() || it->second.type != ELEMENT_BALLS)
                continue;

            const QRect rect = zoneRect(z);
            if (!rect.contains(pos.toPoint()))
                continue;

            const ZoneContent &c = it->second;
            InputEvent_t ev{};
            ev.kind = INPUT_TAP;
            ev.x = (pos.x() - rect.x()) / rect.width() * c.arenaWidth;
            ev.y = (pos.y() - rect.y()) / rect.height() * c.arenaHeight;
            inputQueue_.push(ev);
            return;
        }
    }

private:
    std::vector<Zone> zones_;
    std::unordered_map<std::string, ZoneContent> elements_;
    std::queue<InputEvent_t> inputQueue_;
};

// Главное окно: закрытие превращается в клавишу выхода
class GameWindow : public QMainWindow {
public:
    explicit GameWindow(GameWidget *widget)
        : widget_(widget)
    {
        setWindowTitle(QStringLiteral("Ball Tracker"));
        setCentralWidget(widget_);
    }

    void shutdown() {
        closing_ = true;
        close();
    }

protected:
    void closeEvent(QCloseEvent *event) override {
        if (!closing_)
            widget_->pushKey(VIEW_KEY_ESCAPE);
        event->accept();
    }

private:
    GameWidget *widget_;
    bool closing_ = false;
};

// Контекст Qt-View
struct QtViewContext {
    int width;
    int height;
    int fps;
    GameWindow *window;
    GameWidget *widget;
};

// ---------- Реализация ViewInterface для Qt ----------

static ViewHandle_t qt_init(int width, int height, int fps) {
    if (width <= 0 || height <= 0 || fps < 1)
        return nullptr;

    if (!QApplication::instance()) {
        return nullptr;
    }

    QtViewContext *ctx = new QtViewContext{};
    ctx->width = width;
    ctx->height = height;
    ctx->fps = fps;

    ctx->widget = new GameWidget;
    ctx->widget->setFixedSize(width * VIEW_QT_CELL_W, height * VIEW_QT_CELL_H);
    ctx->window = new GameWindow(ctx->widget);  // окно владеет виджетом

    // Показываем окно, но не блокируем
    ctx->window->show();
    ctx->widget->setFocus();
    QApplication::processEvents();

    return static_cast<ViewHandle_t>(ctx);
}

static ViewResult_t qt_configure_zone(ViewHandle_t handle,
                                      const char *element_id,
                                      int x, int y, int max_w, int max_h)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || std::strlen(element_id) == 0) return VIEW_INVALID_ID;
    if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    ctx->widget->setZone(Zone{x, y, max_w, max_h, element_id});

    return VIEW_OK;
}

static ViewResult_t qt_draw_element(ViewHandle_t handle,
                                    const char *element_id,
                                    const ElementData_t *data)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || !data) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    if (!ctx->widget->hasZone(element_id)) return VIEW_INVALID_ID;

    switch (data->type) {
    case ELEMENT_TEXT:
        if (!data->content.text) return VIEW_BAD_DATA;
        break;
    case ELEMENT_BALLS:
        if (data->content.balls.count < 0 ||
            (data->content.balls.count > 0 && !data->content.balls.data))
            return VIEW_BAD_DATA;
        if (data->content.balls.arena_width <= 0.0 ||
            data->content.balls.arena_height <= 0.0)
            return VIEW_BAD_DATA;
        break;
    case ELEMENT_NUMBER:
        break;
    default:
        return VIEW_BAD_DATA;
    }

    ctx->widget->setElementData(element_id, *data);

    return VIEW_OK;
}

static ViewResult_t qt_render(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    ctx->widget->update();  // явно запрашиваем перерисовку

    return VIEW_OK;
}

static ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t *event) {
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!event) return VIEW_ERROR;

    // Без собственного цикла событий Qt всё обрабатывается здесь
    QApplication::processEvents();

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    InputEvent_t ev{};
    if (ctx->widget->popInput(ev)) {
        *event = ev;
        return VIEW_OK;
    }

    return VIEW_NO_EVENT;
}

static ViewResult_t qt_shutdown(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    if (ctx->window) {
        ctx->window->shutdown();
        delete ctx->window;
    }
    delete ctx;

    return VIEW_OK;
}

// Экспортируемый экземпляр Qt-View
const ViewInterface qt_view = {
    .version = VIEW_INTERFACE_VERSION,
    .init            = qt_init,
    .configure_zone  = qt_configure_zone,
    .draw_element    = qt_draw_element,
    .render          = qt_render,
    .poll_input      = qt_poll_input,
    .shutdown        = qt_shutdown
};
