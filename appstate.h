#ifndef APPSTATE_H
#define APPSTATE_H

#include <QObject>

// Режимы работы с изображением
enum class ProgramState {
    Idle,            // просмотр, панорама/масштаб
    Calibrating,     // два клика по масштабной линейке
    Measuring,       // два клика по диаметру частицы
    GroupSelecting,  // рамка группы
    PickingColor     // выбор цвета частиц для цветового анализа
};

class AppState : public QObject
{
    Q_OBJECT
public:
    explicit AppState(QObject *parent = nullptr);

    ProgramState state() const { return m_state; }

    // Основной метод смены состояния
    void setState(ProgramState newState);

    //Предыдущие состояние
    ProgramState previousState() const { return m_previousState; }

    // Ключ строки интерфейса для режима ("mode_measuring", ...)
    static const char* stateKey(ProgramState state);

signals:
    void stateChanged(ProgramState newState);

private:
    ProgramState m_state = ProgramState::Idle;
    ProgramState m_previousState = ProgramState::Idle;
};

#endif // APPSTATE_H
